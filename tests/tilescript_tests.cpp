#include "diagnostic.hpp"
#include "lexer.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

static int failed = 0;

#define ASSERT(cond, msg) do { \
  if (!(cond)) { std::cerr << "FAIL: " << (msg) << "\n"; failed = 1; } \
  else { std::cout << "PASS: " << (msg) << "\n"; } \
} while(0)

static void test_lexer_move_call() {
  auto result = tilescript::lex("move(1, 2.5)");
  ASSERT(result.ok, "lex move(1, 2.5)");
  ASSERT(result.tokens.size() == 7, "lex move(1, 2.5) token count");
  if (result.tokens.size() == 7) {
    ASSERT(result.tokens[0].kind == tilescript::TokenKind::Ident, "lex ident move");
    ASSERT(result.tokens[1].kind == tilescript::TokenKind::LParen, "lex lparen");
    ASSERT(result.tokens[2].kind == tilescript::TokenKind::IntLiteral, "lex 1");
    ASSERT(result.tokens[3].kind == tilescript::TokenKind::Comma, "lex comma");
    ASSERT(result.tokens[4].kind == tilescript::TokenKind::FloatLiteral, "lex 2.5");
    ASSERT(result.tokens[5].kind == tilescript::TokenKind::RParen, "lex rparen");
    ASSERT(result.tokens[6].kind == tilescript::TokenKind::Eof, "lex eof");
  }
}

static void test_lexer_string() {
  auto result = tilescript::lex("\"a\\tb\"");
  ASSERT(result.ok && result.tokens[0].literal == "a\tb", "lex string escape");
}

static void test_lexer_error_and_render() {
  std::string src = "hp -= 3x";
  auto result = tilescript::lex(src);
  ASSERT(!result.ok, "lex 3x fails");
  ASSERT(result.error.kind == tilescript::LexErrorKind::UnexpectedSymbol, "lex 3x unexpected symbol");
  auto rendered = tilescript::render_diagnostic(result, src);
  ASSERT(rendered.ok, "render 3x");
  ASSERT(rendered.text.find("UnexpectedSymbol at 1:8") == 0, "render 3x header");
}

int main() {
  test_lexer_move_call();
  test_lexer_string();
  test_lexer_error_and_render();
  if (failed) {
    std::cerr << "Some tests failed.\n";
    return EXIT_FAILURE;
  }
  std::cout << "All tests passed.\n";
  return EXIT_SUCCESS;
}
