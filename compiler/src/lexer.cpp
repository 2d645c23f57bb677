#include "lexer.hpp"
#include <utility>

namespace tilescript {

/* Per-call scan state. Never shared between calls. */
struct Scanner {
  const char* src = nullptr;
  size_t size = 0;
  size_t current = 0;     // next unread byte
  size_t start = 0;       // first byte of the token being scanned
  size_t line = 1;
  size_t line_start = 0;  // offset of the first byte of the current line
  LexResult* result = nullptr;
};

static bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

static bool is_alpha(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool at_end(const Scanner& s) {
  return s.current >= s.size;
}

/* Records the error for the byte at `offset` on the current line. */
static void fail(Scanner& s, LexErrorKind kind, size_t offset) {
  s.result->ok = false;
  s.result->error.kind = kind;
  s.result->error.line = s.line;
  s.result->error.column = offset - s.line_start + 1;
  s.result->error.message = lex_error_kind_name(kind);
}

static bool match(Scanner& s, char expected) {
  if (at_end(s) || s.src[s.current] != expected) return false;
  s.current++;
  return true;
}

static TokenKind match_equal(Scanner& s, TokenKind if_equal, TokenKind otherwise) {
  return match(s, '=') ? if_equal : otherwise;
}

static void add_token(Scanner& s, TokenKind kind, std::string literal) {
  Token t;
  t.kind = kind;
  t.line = s.line;
  t.column = s.start - s.line_start + 1;
  t.span.start = s.start;
  t.span.end = s.current;
  t.literal = std::move(literal);
  s.result->tokens.push_back(std::move(t));
}

/* Digits with at most one '.'; a letter or '_' directly after is an error. */
static bool scan_number(Scanner& s, TokenKind* out) {
  bool dot_seen = false;
  while (!at_end(s)) {
    char c = s.src[s.current];
    if (c == '.') {
      if (dot_seen) {
        fail(s, LexErrorKind::UnexpectedSymbol, s.current);
        return false;
      }
      dot_seen = true;
      s.current++;
      continue;
    }
    if (is_digit(c)) {
      s.current++;
      continue;
    }
    if (is_alpha(c)) {
      fail(s, LexErrorKind::UnexpectedSymbol, s.current);
      return false;
    }
    break;
  }
  *out = dot_seen ? TokenKind::FloatLiteral : TokenKind::IntLiteral;
  return true;
}

static void scan_identifier(Scanner& s) {
  while (!at_end(s) && (is_alpha(s.src[s.current]) || is_digit(s.src[s.current]))) {
    s.current++;
  }
}

static bool decode_escape(char c, char* out) {
  switch (c) {
    case 'a': *out = '\x07'; return true;
    case 'b': *out = '\x08'; return true;
    case 'e': *out = '\x1B'; return true;
    case 'f': *out = '\x0C'; return true;
    case 'n': *out = '\n'; return true;
    case 'r': *out = '\r'; return true;
    case 't': *out = '\t'; return true;
    case 'v': *out = '\x0B'; return true;
    case '\\': *out = '\\'; return true;
    case '\'': *out = '\''; return true;
    case '"': *out = '"'; return true;
    case '?': *out = '\x3F'; return true;
    default: return false;
  }
}

/* Body of a string literal; the opening quote is already consumed. */
static bool scan_string(Scanner& s, std::string* literal) {
  std::string decoded;
  for (;;) {
    if (at_end(s)) {
      fail(s, LexErrorKind::UnexpectedEndOfFile, s.current);
      return false;
    }
    char c = s.src[s.current];
    if (c == '"') break;
    if (c == '\n') {
      fail(s, LexErrorKind::UnexpectedEndOfLine, s.current);
      return false;
    }
    s.current++;
    if (c == '\\') {
      if (at_end(s)) {
        fail(s, LexErrorKind::UnexpectedEndOfFile, s.current);
        return false;
      }
      if (!decode_escape(s.src[s.current], &c)) {
        fail(s, LexErrorKind::InvalidEscapeCharacter, s.current);
        return false;
      }
      s.current++;
    }
    decoded += c;
  }
  s.current++;  // closing quote
  *literal = std::move(decoded);
  return true;
}

LexResult lex(const char* data, size_t size) {
  LexResult result;
  Scanner s;
  s.src = data;
  s.size = size;
  s.result = &result;

  while (!at_end(s)) {
    s.start = s.current;
    char c = s.src[s.current++];
    TokenKind kind = TokenKind::Eof;
    std::string literal;
    switch (c) {
      case ' ':
      case '\t':
      case '\r':
        continue;
      case '\n':
        s.line++;
        s.line_start = s.current;
        continue;
      case '!': kind = match_equal(s, TokenKind::BangEqual, TokenKind::Bang); break;
      case '=': kind = match_equal(s, TokenKind::EqualEqual, TokenKind::Equal); break;
      case '<':
        if (match(s, '<'))
          kind = match_equal(s, TokenKind::ShiftLeftEqual, TokenKind::ShiftLeft);
        else
          kind = match_equal(s, TokenKind::LessEqual, TokenKind::Less);
        break;
      case '>':
        if (match(s, '>'))
          kind = match_equal(s, TokenKind::ShiftRightEqual, TokenKind::ShiftRight);
        else
          kind = match_equal(s, TokenKind::GreaterEqual, TokenKind::Greater);
        break;
      case '+':
        kind = match(s, '+') ? TokenKind::Increment : match_equal(s, TokenKind::PlusEqual, TokenKind::Plus);
        break;
      case '-':
        kind = match(s, '-') ? TokenKind::Decrement : match_equal(s, TokenKind::MinusEqual, TokenKind::Minus);
        break;
      case '/': kind = match_equal(s, TokenKind::SlashEqual, TokenKind::Slash); break;
      case '*': kind = match_equal(s, TokenKind::StarEqual, TokenKind::Star); break;
      case '%': kind = match_equal(s, TokenKind::PercentEqual, TokenKind::Percent); break;
      case '&': kind = match_equal(s, TokenKind::AmpEqual, TokenKind::Amp); break;
      case '|': kind = match_equal(s, TokenKind::PipeEqual, TokenKind::Pipe); break;
      case '^': kind = match_equal(s, TokenKind::CaretEqual, TokenKind::Caret); break;
      case '\\': kind = TokenKind::Backslash; break;
      case '(': kind = TokenKind::LParen; break;
      case ')': kind = TokenKind::RParen; break;
      case '[': kind = TokenKind::LSquare; break;
      case ']': kind = TokenKind::RSquare; break;
      case '{': kind = TokenKind::LCurly; break;
      case '}': kind = TokenKind::RCurly; break;
      case '.': kind = TokenKind::Dot; break;
      case ',': kind = TokenKind::Comma; break;
      case ';': kind = TokenKind::Semicolon; break;
      case ':': kind = TokenKind::Colon; break;
      case '"':
        if (!scan_string(s, &literal)) return result;
        kind = TokenKind::StringLiteral;
        break;
      default:
        if (is_digit(c)) {
          if (!scan_number(s, &kind)) return result;
        } else if (is_alpha(c)) {
          scan_identifier(s);
          kind = TokenKind::Ident;
        } else {
          fail(s, LexErrorKind::UnexpectedSymbol, s.start);
          return result;
        }
        break;
    }
    add_token(s, kind, std::move(literal));
  }

  s.start = s.current;
  add_token(s, TokenKind::Eof, {});
  result.ok = true;
  return result;
}

LexResult lex(const std::string& source) {
  return lex(source.data(), source.size());
}

const char* token_kind_name(TokenKind kind) {
  switch (kind) {
    case TokenKind::Bang: return "BANG";
    case TokenKind::Equal: return "EQUAL";
    case TokenKind::Less: return "LESS";
    case TokenKind::Greater: return "MORE";
    case TokenKind::BangEqual: return "BANG_EQ";
    case TokenKind::EqualEqual: return "EQUAL_EQ";
    case TokenKind::LessEqual: return "LESS_EQ";
    case TokenKind::GreaterEqual: return "MORE_EQ";
    case TokenKind::Plus: return "PLUS";
    case TokenKind::Minus: return "MINUS";
    case TokenKind::Slash: return "DIV";
    case TokenKind::Star: return "MUL";
    case TokenKind::Percent: return "MOD";
    case TokenKind::PlusEqual: return "PLUS_EQ";
    case TokenKind::MinusEqual: return "MINUS_EQ";
    case TokenKind::SlashEqual: return "DIV_EQ";
    case TokenKind::StarEqual: return "MUL_EQ";
    case TokenKind::PercentEqual: return "MOD_EQ";
    case TokenKind::Increment: return "INCREMENT";
    case TokenKind::Decrement: return "DECREMENT";
    case TokenKind::Amp: return "BW_AND";
    case TokenKind::Pipe: return "BW_OR";
    case TokenKind::Caret: return "BW_XOR";
    case TokenKind::ShiftLeft: return "BW_SHIFT_LEFT";
    case TokenKind::ShiftRight: return "BW_SHIFT_RIGHT";
    case TokenKind::AmpEqual: return "BW_AND_EQ";
    case TokenKind::PipeEqual: return "BW_OR_EQ";
    case TokenKind::CaretEqual: return "BW_XOR_EQ";
    case TokenKind::ShiftLeftEqual: return "BW_SHIFT_LEFT_EQ";
    case TokenKind::ShiftRightEqual: return "BW_SHIFT_RIGHT_EQ";
    case TokenKind::IntLiteral: return "INTEGER";
    case TokenKind::FloatLiteral: return "DOUBLE";
    case TokenKind::StringLiteral: return "STRING";
    case TokenKind::Ident: return "IDENTIFIER";
    case TokenKind::Backslash: return "BACKSLASH";
    case TokenKind::LParen: return "BRACKET_OPEN";
    case TokenKind::RParen: return "BRACKET_CLOSE";
    case TokenKind::LSquare: return "SQUARE_BRACKET_OPEN";
    case TokenKind::RSquare: return "SQUARE_BRACKET_CLOSE";
    case TokenKind::LCurly: return "CURLY_BRACKET_OPEN";
    case TokenKind::RCurly: return "CURLY_BRACKET_CLOSE";
    case TokenKind::Dot: return "DOT";
    case TokenKind::Comma: return "COMMA";
    case TokenKind::Semicolon: return "SEMICOLON";
    case TokenKind::Colon: return "COLON";
    case TokenKind::Eof: return "EOF";
  }
  return "UNKNOWN";
}

const char* lex_error_kind_name(LexErrorKind kind) {
  switch (kind) {
    case LexErrorKind::UnexpectedEndOfFile: return "UnexpectedEndOfFile";
    case LexErrorKind::UnexpectedSymbol: return "UnexpectedSymbol";
    case LexErrorKind::InvalidEscapeCharacter: return "InvalidEscapeCharacter";
    case LexErrorKind::UnexpectedEndOfLine: return "UnexpectedEndOfLine";
  }
  return "UnknownError";
}

std::string token_lexeme(const Token& token, const std::string& source) {
  if (token.span.start > token.span.end || token.span.end > source.size()) return {};
  return source.substr(token.span.start, token.span.end - token.span.start);
}

}  // namespace tilescript
