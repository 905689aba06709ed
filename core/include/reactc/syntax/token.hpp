// reactc/syntax/token.hpp - Token kinds for TypeScript + JSX
#pragma once

#include <cstdint>
#include <string_view>

#include "reactc/basic/source_manager.hpp"

namespace reactc::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,  // keywords are identifiers; the parser checks token text
  PrivateName,  // #field
  NumericLiteral,
  BigIntLiteral,
  StringLiteral,  // token.text keeps the quotes
  RegexLiteral,

  // Template literal pieces. `text` includes the delimiters (` ${ }).
  NoSubstitutionTemplate,
  TemplateHead,
  TemplateMiddle,
  TemplateTail,

  JsxText,

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,
  Semicolon,
  Comma,
  Colon,
  Dot,
  Ellipsis,     // ...
  Question,     // ?
  QuestionDot,  // ?.
  Arrow,        // =>
  At,

  // Operators
  Lt,
  Gt,
  LtEq,
  GtEq,
  EqEq,
  BangEq,
  EqEqEq,
  BangEqEq,
  Plus,
  Minus,
  Star,
  StarStar,
  Slash,
  Percent,
  PlusPlus,
  MinusMinus,
  LtLt,
  GtGt,
  GtGtGt,
  Amp,
  Pipe,
  Caret,
  Bang,
  Tilde,
  AmpAmp,
  PipePipe,
  QuestionQuestion,

  // Assignment operators
  Eq,
  PlusEq,
  MinusEq,
  StarEq,
  StarStarEq,
  SlashEq,
  PercentEq,
  LtLtEq,
  GtGtEq,
  GtGtGtEq,
  AmpEq,
  PipeEq,
  CaretEq,
  AmpAmpEq,
  PipePipeEq,
  QuestionQuestionEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;

  /// A line terminator (or a comment containing one) precedes this token.
  bool newline_before = false;

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }

  /// Identifier (or keyword) with exactly this text.
  [[nodiscard]] bool is_word(std::string_view w) const noexcept
  {
    return kind == TokenKind::Identifier && text == w;
  }
};

[[nodiscard]] std::string_view to_string(TokenKind kind) noexcept;

/// True for `=`, `+=`, ... `??=`.
[[nodiscard]] constexpr bool is_assignment_op(TokenKind kind) noexcept
{
  return kind >= TokenKind::Eq && kind <= TokenKind::QuestionQuestionEq;
}

/// Reserved words that can never be an identifier reference.
[[nodiscard]] bool is_reserved_word(std::string_view word) noexcept;

}  // namespace reactc::syntax
