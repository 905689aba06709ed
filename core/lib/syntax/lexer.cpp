// reactc/syntax/lexer.cpp - TypeScript + JSX tokenizer
#include "reactc/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace reactc::syntax
{

namespace
{

bool is_ident_start(unsigned char c)
{
  return (std::isalpha(c) != 0) || c == '_' || c == '$' || c >= 0x80;
}

bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }

bool is_digit_or_sep(unsigned char c) { return (std::isdigit(c) != 0) || c == '_'; }

bool is_hex_digit(unsigned char c)
{
  return (std::isxdigit(c) != 0) || c == '_';
}

struct Punct
{
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first so the first match is the maximal munch.
constexpr std::array<Punct, 57> k_punctuators = {{
  {">>>=", TokenKind::GtGtGtEq},
  {"...", TokenKind::Ellipsis},
  {"===", TokenKind::EqEqEq},
  {"!==", TokenKind::BangEqEq},
  {"**=", TokenKind::StarStarEq},
  {"<<=", TokenKind::LtLtEq},
  {">>=", TokenKind::GtGtEq},
  {">>>", TokenKind::GtGtGt},
  {"&&=", TokenKind::AmpAmpEq},
  {"||=", TokenKind::PipePipeEq},
  {"?\?=", TokenKind::QuestionQuestionEq},
  {"=>", TokenKind::Arrow},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::BangEq},
  {"<=", TokenKind::LtEq},
  {">=", TokenKind::GtEq},
  {"**", TokenKind::StarStar},
  {"++", TokenKind::PlusPlus},
  {"--", TokenKind::MinusMinus},
  {"<<", TokenKind::LtLt},
  {">>", TokenKind::GtGt},
  {"&&", TokenKind::AmpAmp},
  {"||", TokenKind::PipePipe},
  {"??", TokenKind::QuestionQuestion},
  {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},
  {"/=", TokenKind::SlashEq},
  {"%=", TokenKind::PercentEq},
  {"&=", TokenKind::AmpEq},
  {"|=", TokenKind::PipeEq},
  {"^=", TokenKind::CaretEq},
  {"(", TokenKind::LParen},
  {")", TokenKind::RParen},
  {"{", TokenKind::LBrace},
  {"}", TokenKind::RBrace},
  {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},
  {";", TokenKind::Semicolon},
  {",", TokenKind::Comma},
  {":", TokenKind::Colon},
  {".", TokenKind::Dot},
  {"?", TokenKind::Question},
  {"@", TokenKind::At},
  {"<", TokenKind::Lt},
  {">", TokenKind::Gt},
  {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},
  {"*", TokenKind::Star},
  {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},
  {"&", TokenKind::Amp},
  {"|", TokenKind::Pipe},
  {"^", TokenKind::Caret},
  {"!", TokenKind::Bang},
  {"~", TokenKind::Tilde},
  {"=", TokenKind::Eq},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_trivia()
{
  bool newline = false;
  while (!eof()) {
    const char c = peek();
    if (c == '\n') {
      newline = true;
      advance();
    } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
      advance();
    } else if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance();
      }
    } else if (starts_with("/*")) {
      advance(2);
      while (!eof() && !starts_with("*/")) {
        if (peek() == '\n') {
          newline = true;
        }
        advance();
      }
      if (!eof()) {
        advance(2);
      }
    } else if (starts_with("\xEF\xBB\xBF")) {  // UTF-8 BOM
      advance(3);
    } else {
      break;
    }
  }
  return newline;
}

Token Lexer::next()
{
  const bool newline = skip_trivia();
  const auto start = static_cast<uint32_t>(pos_);

  Token t;
  if (eof()) {
    t = make(TokenKind::Eof, start);
  } else {
    const auto c = static_cast<unsigned char>(peek());
    if (is_ident_start(c)) {
      t = lex_identifier();
    } else if (std::isdigit(c) != 0 || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
      t = lex_number();
    } else if (c == '"' || c == '\'') {
      t = lex_string(static_cast<char>(c));
    } else if (c == '`') {
      advance();
      t = lex_template_part(start);
    } else if (c == '#' && is_ident_start(static_cast<unsigned char>(peek(1)))) {
      advance();
      t = lex_identifier();
      t.kind = TokenKind::PrivateName;
      t.range.start = start;
      t.text = src_.substr(start, pos_ - start);
    } else {
      t = lex_punctuator();
    }
  }

  t.newline_before = newline;
  return t;
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  return make(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  if (peek() == '0') {
    const char p1 = peek(1);
    if (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O') {
      advance(2);
      while (!eof() && is_hex_digit(static_cast<unsigned char>(peek()))) {
        advance();
      }
      if (peek() == 'n') {
        advance();
        return make(TokenKind::BigIntLiteral, start);
      }
      return make(TokenKind::NumericLiteral, start);
    }
  }

  while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
    advance();
  }
  if (peek() == 'n') {
    advance();
    return make(TokenKind::BigIntLiteral, start);
  }
  if (peek() == '.') {
    advance();
    while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }
  if (peek() == 'e' || peek() == 'E') {
    const char sign = peek(1);
    const size_t digits_at = (sign == '+' || sign == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek(digits_at))) != 0) {
      advance(digits_at);
      while (!eof() && is_digit_or_sep(static_cast<unsigned char>(peek()))) {
        advance();
      }
    }
  }
  return make(TokenKind::NumericLiteral, start);
}

Token Lexer::lex_string(char quote, bool jsx)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance();  // opening quote
  while (!eof()) {
    const char c = peek();
    if (c == '\\' && !jsx) {
      advance(2);
      continue;
    }
    if (c == '\n' && !jsx) {
      break;
    }
    advance();
    if (c == quote) {
      return make(TokenKind::StringLiteral, start);
    }
  }
  // Unterminated: the parser reports it through the Unknown kind.
  return make(TokenKind::Unknown, start);
}

Token Lexer::lex_template_part(uint32_t start)
{
  // pos_ is just past the opening '`' or the closing '}' of a substitution.
  const bool is_head = src_[start] == '`';
  while (!eof()) {
    const char c = peek();
    if (c == '\\') {
      advance(2);
      continue;
    }
    if (c == '`') {
      advance();
      return make(is_head ? TokenKind::NoSubstitutionTemplate : TokenKind::TemplateTail, start);
    }
    if (c == '$' && peek(1) == '{') {
      advance(2);
      return make(is_head ? TokenKind::TemplateHead : TokenKind::TemplateMiddle, start);
    }
    advance();
  }
  return make(TokenKind::Unknown, start);
}

Token Lexer::lex_punctuator()
{
  const auto start = static_cast<uint32_t>(pos_);

  // `?.` is optional chaining only when not followed by a digit (a ? .5 : b).
  if (starts_with("?.") && std::isdigit(static_cast<unsigned char>(peek(2))) == 0) {
    advance(2);
    return make(TokenKind::QuestionDot, start);
  }

  for (const auto & p : k_punctuators) {
    if (starts_with(p.text)) {
      advance(p.text.size());
      return make(p.kind, start);
    }
  }

  advance();
  return make(TokenKind::Unknown, start);
}

Token Lexer::rescan_as_regex(const Token & slash)
{
  pos_ = slash.range.start + 1;
  bool in_class = false;
  while (!eof()) {
    const char c = peek();
    if (c == '\n') {
      break;
    }
    if (c == '\\') {
      advance(2);
      continue;
    }
    advance();
    if (c == '[') {
      in_class = true;
    } else if (c == ']') {
      in_class = false;
    } else if (c == '/' && !in_class) {
      while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
        advance();  // flags
      }
      Token t = make(TokenKind::RegexLiteral, slash.range.start);
      t.newline_before = slash.newline_before;
      return t;
    }
  }
  Token t = make(TokenKind::Unknown, slash.range.start);
  t.newline_before = slash.newline_before;
  return t;
}

Token Lexer::rescan_template_continuation(const Token & rbrace)
{
  pos_ = rbrace.range.start + 1;
  return lex_template_part(rbrace.range.start);
}

Token Lexer::rescan_jsx_child(uint32_t pos)
{
  pos_ = pos;
  const auto start = static_cast<uint32_t>(pos_);
  if (eof()) {
    return make(TokenKind::Eof, start);
  }
  if (peek() == '{') {
    advance();
    return make(TokenKind::LBrace, start);
  }
  if (peek() == '<') {
    advance();
    return make(TokenKind::Lt, start);
  }
  while (!eof() && peek() != '{' && peek() != '<') {
    advance();
  }
  return make(TokenKind::JsxText, start);
}

Token Lexer::rescan_jsx_string(const Token & tok)
{
  pos_ = tok.range.start;
  const char quote = peek();
  if (quote != '"' && quote != '\'') {
    return tok;
  }
  Token t = lex_string(quote, true);
  t.newline_before = tok.newline_before;
  return t;
}

Token Lexer::rescan_jsx_identifier(const Token & ident)
{
  pos_ = ident.range.end;
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == '-' || is_ident_continue(c)) {
      advance();
    } else {
      break;
    }
  }
  Token t = make(TokenKind::Identifier, ident.range.start);
  t.newline_before = ident.newline_before;
  return t;
}

Token Lexer::rescan_single_gt(const Token & tok)
{
  pos_ = tok.range.start + 1;
  Token t = make(TokenKind::Gt, tok.range.start);
  t.newline_before = tok.newline_before;
  return t;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    Token t = next();
    const bool done = t.kind == TokenKind::Eof;
    out.push_back(t);
    if (done) {
      break;
    }
  }
  return out;
}

}  // namespace reactc::syntax
