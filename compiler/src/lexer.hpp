#ifndef TILESCRIPT_LEXER_HPP
#define TILESCRIPT_LEXER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace tilescript {

enum class TokenKind {
  // comparison / assignment
  Bang,          // !
  Equal,         // =
  Less,          // <
  Greater,       // >
  BangEqual,     // !=
  EqualEqual,    // ==
  LessEqual,     // <=
  GreaterEqual,  // >=

  // arithmetic
  Plus,
  Minus,
  Slash,
  Star,
  Percent,
  PlusEqual,
  MinusEqual,
  SlashEqual,
  StarEqual,
  PercentEqual,
  Increment,  // ++
  Decrement,  // --

  // bitwise
  Amp,
  Pipe,
  Caret,
  ShiftLeft,
  ShiftRight,
  AmpEqual,
  PipeEqual,
  CaretEqual,
  ShiftLeftEqual,
  ShiftRightEqual,

  IntLiteral,
  FloatLiteral,
  StringLiteral,

  Ident,

  Backslash,
  LParen,
  RParen,
  LSquare,  // [
  RSquare,  // ]
  LCurly,   // {
  RCurly,   // }
  Dot,
  Comma,
  Semicolon,
  Colon,

  Eof,
};

/* Half-open byte range [start, end) into the scanned buffer. */
struct Span {
  size_t start = 0;
  size_t end = 0;
};

struct Token {
  TokenKind kind = TokenKind::Eof;
  size_t line = 0;
  size_t column = 0;
  Span span;
  std::string literal;  // StringLiteral only: escape-decoded content
  bool has_literal() const { return kind == TokenKind::StringLiteral; }
};

enum class LexErrorKind {
  UnexpectedEndOfFile,
  UnexpectedSymbol,
  InvalidEscapeCharacter,
  UnexpectedEndOfLine,
};

struct LexError {
  LexErrorKind kind = LexErrorKind::UnexpectedEndOfFile;
  size_t line = 0;
  size_t column = 0;
  std::string message;
};

/* On failure, tokens holds what was recognized before the error and no Eof. */
struct LexResult {
  std::vector<Token> tokens;
  bool ok = false;
  LexError error;
};

LexResult lex(const char* data, size_t size);
LexResult lex(const std::string& source);

const char* token_kind_name(TokenKind kind);
const char* lex_error_kind_name(LexErrorKind kind);

/* Raw source text covered by a token's span. */
std::string token_lexeme(const Token& token, const std::string& source);

}  // namespace tilescript

#endif
