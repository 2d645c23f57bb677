#ifndef TILESCRIPT_DIAGNOSTIC_HPP
#define TILESCRIPT_DIAGNOSTIC_HPP

#include "lexer.hpp"
#include <string>

namespace tilescript {

struct RenderResult {
  bool ok = false;
  std::string text;
  std::string error;
};

/** Formats a lexical error as
 *    <kind> at <line>:<column>
 *    <line, width 5>| <source line>
 *    <6 + column spaces>^
 *  The source line is looked up by err.line; nothing is rescanned. */
std::string render_lex_error(const LexError& err, const std::string& source);

/* Fails with a message when result carries no error. */
RenderResult render_diagnostic(const LexResult& result, const std::string& source);

}  // namespace tilescript

#endif
