#include "diagnostic.hpp"
#include <iomanip>
#include <sstream>

namespace tilescript {

/* Offset of the first byte of 1-based `line`, or source.size() if there is no such line. */
static size_t line_start_offset(const std::string& source, size_t line) {
  size_t pos = 0;
  for (size_t current = 1; current < line; ++current) {
    size_t nl = source.find('\n', pos);
    if (nl == std::string::npos) return source.size();
    pos = nl + 1;
  }
  return pos;
}

static std::string line_text(const std::string& source, size_t line) {
  size_t begin = line_start_offset(source, line);
  size_t end = source.find('\n', begin);
  if (end == std::string::npos) end = source.size();
  return source.substr(begin, end - begin);
}

std::string render_lex_error(const LexError& err, const std::string& source) {
  std::ostringstream out;
  out << lex_error_kind_name(err.kind) << " at " << err.line << ":" << err.column << "\n";
  out << std::setw(5) << err.line << "| " << line_text(source, err.line) << "\n";
  out << std::string(6 + err.column, ' ') << "^\n";
  return out.str();
}

RenderResult render_diagnostic(const LexResult& result, const std::string& source) {
  RenderResult r;
  if (result.ok || result.error.line == 0) {
    r.error = "no lexical error to render";
    return r;
  }
  r.text = render_lex_error(result.error, source);
  r.ok = true;
  return r;
}

}  // namespace tilescript
