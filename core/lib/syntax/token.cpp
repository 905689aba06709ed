// reactc/syntax/token.cpp - Token kind names and reserved words
#include "reactc/syntax/token.hpp"

#include <algorithm>
#include <array>

namespace reactc::syntax
{

std::string_view to_string(TokenKind kind) noexcept
{
  switch (kind) {
    case TokenKind::Eof:
      return "end of file";
    case TokenKind::Unknown:
      return "unknown token";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::PrivateName:
      return "private name";
    case TokenKind::NumericLiteral:
      return "number";
    case TokenKind::BigIntLiteral:
      return "bigint";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::RegexLiteral:
      return "regular expression";
    case TokenKind::NoSubstitutionTemplate:
    case TokenKind::TemplateHead:
    case TokenKind::TemplateMiddle:
    case TokenKind::TemplateTail:
      return "template literal";
    case TokenKind::JsxText:
      return "JSX text";
    case TokenKind::LParen:
      return "'('";
    case TokenKind::RParen:
      return "')'";
    case TokenKind::LBrace:
      return "'{'";
    case TokenKind::RBrace:
      return "'}'";
    case TokenKind::LBracket:
      return "'['";
    case TokenKind::RBracket:
      return "']'";
    case TokenKind::Semicolon:
      return "';'";
    case TokenKind::Comma:
      return "','";
    case TokenKind::Colon:
      return "':'";
    case TokenKind::Dot:
      return "'.'";
    case TokenKind::Ellipsis:
      return "'...'";
    case TokenKind::Question:
      return "'?'";
    case TokenKind::QuestionDot:
      return "'?.'";
    case TokenKind::Arrow:
      return "'=>'";
    case TokenKind::At:
      return "'@'";
    case TokenKind::Lt:
      return "'<'";
    case TokenKind::Gt:
      return "'>'";
    case TokenKind::LtEq:
      return "'<='";
    case TokenKind::GtEq:
      return "'>='";
    case TokenKind::EqEq:
      return "'=='";
    case TokenKind::BangEq:
      return "'!='";
    case TokenKind::EqEqEq:
      return "'==='";
    case TokenKind::BangEqEq:
      return "'!=='";
    case TokenKind::Plus:
      return "'+'";
    case TokenKind::Minus:
      return "'-'";
    case TokenKind::Star:
      return "'*'";
    case TokenKind::StarStar:
      return "'**'";
    case TokenKind::Slash:
      return "'/'";
    case TokenKind::Percent:
      return "'%'";
    case TokenKind::PlusPlus:
      return "'++'";
    case TokenKind::MinusMinus:
      return "'--'";
    case TokenKind::LtLt:
      return "'<<'";
    case TokenKind::GtGt:
      return "'>>'";
    case TokenKind::GtGtGt:
      return "'>>>'";
    case TokenKind::Amp:
      return "'&'";
    case TokenKind::Pipe:
      return "'|'";
    case TokenKind::Caret:
      return "'^'";
    case TokenKind::Bang:
      return "'!'";
    case TokenKind::Tilde:
      return "'~'";
    case TokenKind::AmpAmp:
      return "'&&'";
    case TokenKind::PipePipe:
      return "'||'";
    case TokenKind::QuestionQuestion:
      return "'??'";
    case TokenKind::Eq:
      return "'='";
    case TokenKind::PlusEq:
      return "'+='";
    case TokenKind::MinusEq:
      return "'-='";
    case TokenKind::StarEq:
      return "'*='";
    case TokenKind::StarStarEq:
      return "'**='";
    case TokenKind::SlashEq:
      return "'/='";
    case TokenKind::PercentEq:
      return "'%='";
    case TokenKind::LtLtEq:
      return "'<<='";
    case TokenKind::GtGtEq:
      return "'>>='";
    case TokenKind::GtGtGtEq:
      return "'>>>='";
    case TokenKind::AmpEq:
      return "'&='";
    case TokenKind::PipeEq:
      return "'|='";
    case TokenKind::CaretEq:
      return "'^='";
    case TokenKind::AmpAmpEq:
      return "'&&='";
    case TokenKind::PipePipeEq:
      return "'||='";
    case TokenKind::QuestionQuestionEq:
      return "'?\?='";
  }
  return "token";
}

bool is_reserved_word(std::string_view word) noexcept
{
  // Sorted for binary search.
  static constexpr std::array<std::string_view, 36> k_reserved = {
    "break",  "case",    "catch",  "class",  "const",      "continue", "debugger", "default",
    "delete", "do",      "else",   "enum",   "export",     "extends",  "false",    "finally",
    "for",    "function", "if",    "import", "in",         "instanceof", "new",    "null",
    "return", "super",   "switch", "this",   "throw",      "true",     "try",      "typeof",
    "var",    "void",    "while",  "with",
  };
  return std::binary_search(k_reserved.begin(), k_reserved.end(), word);
}

}  // namespace reactc::syntax
