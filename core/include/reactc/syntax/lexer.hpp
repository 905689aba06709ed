// reactc/syntax/lexer.hpp - On-demand tokenizer for TypeScript + JSX
//
// JavaScript cannot be tokenized without parser context (regex vs divide,
// template continuations, JSX text), so the lexer hands out one token at a
// time and offers rescan_* entry points the parser calls when the context
// calls for a different reading of the same bytes.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "reactc/syntax/token.hpp"

namespace reactc::syntax
{

class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  /// Next token in ordinary (expression) context. A '/' is always Slash/SlashEq.
  [[nodiscard]] Token next();

  /// Re-read a Slash/SlashEq token as the start of a regular expression literal.
  [[nodiscard]] Token rescan_as_regex(const Token & slash);

  /// Re-read a RBrace token as the continuation of a template literal.
  [[nodiscard]] Token rescan_template_continuation(const Token & rbrace);

  /// Read JSX child content at `pos`: JsxText, '{', '<' or Eof.
  [[nodiscard]] Token rescan_jsx_child(uint32_t pos);

  /// Re-read a quoted attribute value with JSX rules (no escapes, may span lines).
  [[nodiscard]] Token rescan_jsx_string(const Token & tok);

  /// Extend an identifier token with JSX name characters (`data-id`, `aria-label`).
  [[nodiscard]] Token rescan_jsx_identifier(const Token & ident);

  /// Split a compound '>' token (>>, >=, >>=, ...) so only its first '>' is consumed.
  [[nodiscard]] Token rescan_single_gt(const Token & tok);

  /// Tokenize the whole input in ordinary context (testing and tools).
  [[nodiscard]] std::vector<Token> lex_all();

  void reset(uint32_t pos) noexcept { pos_ = pos; }
  [[nodiscard]] uint32_t position() const noexcept { return static_cast<uint32_t>(pos_); }
  [[nodiscard]] std::string_view source() const noexcept { return src_; }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;
  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skip whitespace and comments; returns true if a line terminator was crossed.
  bool skip_trivia();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(char quote, bool jsx = false);
  [[nodiscard]] Token lex_template_part(uint32_t start);
  [[nodiscard]] Token lex_punctuator();

  [[nodiscard]] Token make(TokenKind kind, uint32_t start) const noexcept
  {
    Token t;
    t.kind = kind;
    t.range = {start, static_cast<uint32_t>(pos_)};
    t.text = src_.substr(start, pos_ - start);
    return t;
  }

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace reactc::syntax
