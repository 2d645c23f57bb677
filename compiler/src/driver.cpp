#include "driver.hpp"
#include "diagnostic.hpp"
#include "lexer.hpp"
#include <fstream>
#include <sstream>

namespace tilescript {

const char* sample_source() {
  return " pub fn meow(arg1: i32) void {\n"
         "     if (arg1 != 3.1415 and 3 | 2 == 7) {\n"
         "         print(\"nya\");\n"
         "     }\n"
         "     print(\"{}\", arg1);\n"
         " }";
}

int scan_source(const std::string& name, const std::string& source, std::ostream& out,
                std::ostream& err, const DriverOptions& opts) {
  if (opts.debug) {
    err << "tilescript: scanning " << name << " (" << source.size() << " bytes)\n";
  }

  LexResult result = lex(source);
  if (!result.ok) {
    if (opts.debug) {
      err << "tilescript: " << result.tokens.size() << " tokens before " << result.error.message
          << "\n";
    }
    RenderResult rendered = render_diagnostic(result, source);
    if (!rendered.ok) {
      err << "tilescript: " << rendered.error << "\n";
      return 1;
    }
    err << rendered.text;
    return 1;
  }

  for (const Token& t : result.tokens) {
    out << token_kind_name(t.kind) << " on line " << t.line << " in pos " << t.span.start << "-"
        << t.span.end << " " << token_lexeme(t, source) << " "
        << (t.has_literal() ? t.literal : std::string("null")) << "\n";
  }
  if (opts.debug) {
    err << "tilescript: " << result.tokens.size() << " tokens\n";
  }
  return 0;
}

int scan_file(const std::string& path, std::ostream& out, std::ostream& err,
              const DriverOptions& opts) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    err << "tilescript: cannot open '" << path << "'\n";
    return 1;
  }
  std::stringstream buf;
  buf << f.rdbuf();
  return scan_source(path, buf.str(), out, err, opts);
}

}  // namespace tilescript
