#ifndef TILESCRIPT_DRIVER_HPP
#define TILESCRIPT_DRIVER_HPP

#include <ostream>
#include <string>

namespace tilescript {

struct DriverOptions {
  bool debug = false;  // TILESCRIPT_DEBUG
};

/* Built-in script scanned when no input file is given. */
const char* sample_source();

/** Scans source and prints one line per token to out. On a lexical error the
 *  diagnostic goes to err and 1 is returned; 0 on success. */
int scan_source(const std::string& name, const std::string& source, std::ostream& out,
                std::ostream& err, const DriverOptions& opts);

int scan_file(const std::string& path, std::ostream& out, std::ostream& err,
              const DriverOptions& opts);

}  // namespace tilescript

#endif
