#include <cstdlib>
#include <iostream>
#include <string>

#include "driver.hpp"

#ifndef TILESCRIPT_VERSION_STRING
#define TILESCRIPT_VERSION_STRING "unknown"
#endif

static void print_usage() {
  std::cout << "TileScript scanner – usage: tilescript [options] [input.tile]\n";
  std::cout << "  --help, -h      Show this help\n";
  std::cout << "  --version, -v   Show scanner version\n";
  std::cout << "  scan <file>     Tokenize a script file\n";
  std::cout << "With no input file the built-in sample script is tokenized.\n";
}

int main(int argc, char* argv[]) {
  tilescript::DriverOptions opts;
  opts.debug = getenv("TILESCRIPT_DEBUG") != nullptr;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    }
    if (arg == "--version" || arg == "-v") {
      std::cout << "TileScript scanner " << TILESCRIPT_VERSION_STRING << "\n";
      return 0;
    }
    if (arg == "scan" && i + 1 < argc) {
      return tilescript::scan_file(argv[++i], std::cout, std::cerr, opts);
    }
    if (arg.size() > 0 && arg[0] != '-') {
      return tilescript::scan_file(arg, std::cout, std::cerr, opts);
    }
    std::cerr << "tilescript: unknown option '" << arg << "'\n";
    print_usage();
    return 1;
  }
  return tilescript::scan_source("<sample>", tilescript::sample_source(), std::cout, std::cerr,
                                 opts);
}
