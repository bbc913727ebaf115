// mathedit/syntax/scanner.cpp - Markup token scanner
#include "mathedit/syntax/scanner.hpp"

namespace mathedit::syntax
{
namespace
{

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }

bool is_ascii_letter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool is_digit(char c) { return c >= '0' && c <= '9'; }

// ASCII letters plus every byte of a UTF-8 multibyte sequence
bool is_word_byte(char c) { return is_ascii_letter(c) || static_cast<unsigned char>(c) >= 0x80; }

}  // namespace

std::vector<Token> Scanner::scan_all()
{
  std::vector<Token> out;
  out.reserve(src_.size() / 2 + 1);
  while (true) {
    Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

void Scanner::skip_whitespace()
{
  while (!eof() && is_space(peek())) {
    advance(1);
  }
}

void Scanner::skip_comment()
{
  while (!eof() && peek() != '\n') {
    advance(1);
  }
}

Token Scanner::next_token()
{
  skip_whitespace();

  const size_t start = pos_;
  if (eof()) {
    return make_token(TokenKind::Eof, start, {});
  }

  const char c = peek();
  switch (c) {
    case '%':
      return scan_comment();
    case '\\':
      return scan_backslash();
    case '{':
      advance(1);
      return make_token(TokenKind::OpenGroup, start, src_.substr(start, 1));
    case '}':
      advance(1);
      return make_token(TokenKind::CloseGroup, start, src_.substr(start, 1));
    case '[':
      advance(1);
      return make_token(TokenKind::OpenBracket, start, src_.substr(start, 1));
    case ']':
      advance(1);
      return make_token(TokenKind::CloseBracket, start, src_.substr(start, 1));
    case '_':
      advance(1);
      return make_token(TokenKind::SubscriptMarker, start, src_.substr(start, 1));
    case '^':
      advance(1);
      return make_token(TokenKind::SuperscriptMarker, start, src_.substr(start, 1));
    case '&':
      advance(1);
      return make_token(TokenKind::ColumnSeparator, start, src_.substr(start, 1));
    default:
      return scan_literal();
  }
}

Token Scanner::scan_comment()
{
  const size_t start = pos_;
  advance(1);  // %
  const size_t body = pos_;
  skip_comment();
  size_t body_end = pos_;
  if (body_end > body && src_[body_end - 1] == '\r') {
    --body_end;
  }
  return make_token(TokenKind::Comment, start, src_.substr(body, body_end - body));
}

Token Scanner::scan_backslash()
{
  const size_t start = pos_;
  advance(1);  // backslash

  if (peek() == '\\') {
    advance(1);
    return make_token(TokenKind::RowSeparator, start, src_.substr(start, 2));
  }

  // Look past whitespace and comments for command letters
  const size_t after_backslash = pos_;
  while (!eof()) {
    if (is_space(peek())) {
      advance(1);
    } else if (peek() == '%') {
      skip_comment();
    } else {
      break;
    }
  }

  if (!eof() && is_ascii_letter(peek())) {
    const size_t name_start = pos_;
    while (!eof() && is_ascii_letter(peek())) {
      advance(1);
    }
    const std::string_view name = src_.substr(name_start, pos_ - name_start);

    if (name == "begin" || name == "end") {
      // \begin{name} / \end{name}: name is letters and '*'
      const size_t after_name = pos_;
      skip_whitespace();
      if (peek() == '{') {
        advance(1);
        const size_t env_start = pos_;
        while (!eof() && (is_ascii_letter(peek()) || peek() == '*')) {
          advance(1);
        }
        const size_t env_end = pos_;
        if (env_end > env_start && peek() == '}') {
          advance(1);
          return make_token(
            name == "begin" ? TokenKind::EnvironmentBegin : TokenKind::EnvironmentEnd, start,
            src_.substr(env_start, env_end - env_start));
        }
      }
      pos_ = after_name;
    }
    return make_token(TokenKind::Command, start, name);
  }

  // Control symbol: exactly one character after the backslash
  pos_ = after_backslash;
  if (eof()) {
    return make_token(TokenKind::ControlSymbol, start, {});
  }
  // Keep a UTF-8 sequence together
  size_t len = 1;
  if (static_cast<unsigned char>(peek()) >= 0xC0) {
    while (static_cast<unsigned char>(peek(len)) >= 0x80 &&
           static_cast<unsigned char>(peek(len)) < 0xC0) {
      ++len;
    }
  }
  advance(len);
  return make_token(TokenKind::ControlSymbol, start, src_.substr(after_backslash, len));
}

Token Scanner::scan_literal()
{
  const size_t start = pos_;
  const char c = peek();

  if (is_digit(c)) {
    while (!eof() && is_digit(peek())) {
      advance(1);
    }
    if (peek() == '.' && is_digit(peek(1))) {
      advance(1);
      while (!eof() && is_digit(peek())) {
        advance(1);
      }
    }
  } else if (is_word_byte(c)) {
    while (!eof() && is_word_byte(peek())) {
      advance(1);
    }
  } else {
    advance(1);
  }
  return make_token(TokenKind::Literal, start, src_.substr(start, pos_ - start));
}

std::vector<Token> scan(std::string_view markup)
{
  Scanner scanner(markup);
  return scanner.scan_all();
}

}  // namespace mathedit::syntax
