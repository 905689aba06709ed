#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "reactc/syntax/lexer.hpp"
#include "reactc/syntax/token.hpp"

using reactc::syntax::Lexer;
using reactc::syntax::Token;
using reactc::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds(std::string_view src)
{
  Lexer lex(src);
  std::vector<TokenKind> out;
  for (const auto & t : lex.lex_all()) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, SkipsCommentsAndTracksNewlines)
{
  const std::string_view src =
    "// line\n"
    "/* block */ let x = 1; // trailing\n"
    "x /* multi\nline */ ++";

  Lexer lex(src);
  const auto toks = lex.lex_all();

  ASSERT_EQ(toks.size(), 8u);
  EXPECT_TRUE(toks[0].is_word("let"));
  EXPECT_TRUE(toks[0].newline_before);
  EXPECT_FALSE(toks[1].newline_before);
  EXPECT_EQ(toks[5].text, "x");
  EXPECT_TRUE(toks[5].newline_before);
  EXPECT_EQ(toks[6].kind, TokenKind::PlusPlus);
  EXPECT_TRUE(toks[6].newline_before);  // block comment spans a line break
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, NumericLiterals)
{
  for (const std::string_view lit : {"0xDEADBEEF", "0b1010", "0o777", "1_000", "1.5e-3", ".5"}) {
    Lexer lex(lit);
    const Token t = lex.next();
    EXPECT_EQ(t.kind, TokenKind::NumericLiteral) << lit;
    EXPECT_EQ(t.text, lit);
  }

  Lexer big("10n");
  EXPECT_EQ(big.next().kind, TokenKind::BigIntLiteral);
}

TEST(SyntaxLexer, StringsKeepQuotesAndEscapes)
{
  Lexer lex(R"("a\"b" 'c')");
  const Token a = lex.next();
  const Token c = lex.next();
  EXPECT_EQ(a.kind, TokenKind::StringLiteral);
  EXPECT_EQ(a.text, R"("a\"b")");
  EXPECT_EQ(c.text, "'c'");
}

TEST(SyntaxLexer, UnterminatedStringIsUnknown)
{
  Lexer lex("'abc\nx");
  EXPECT_EQ(lex.next().kind, TokenKind::Unknown);
}

TEST(SyntaxLexer, LongestPunctuatorWins)
{
  EXPECT_EQ(
    kinds("=> === !== ... ?? ?.x >>>= ??="),
    (std::vector<TokenKind>{
      TokenKind::Arrow, TokenKind::EqEqEq, TokenKind::BangEqEq, TokenKind::Ellipsis,
      TokenKind::QuestionQuestion, TokenKind::QuestionDot, TokenKind::Identifier,
      TokenKind::GtGtGtEq, TokenKind::QuestionQuestionEq, TokenKind::Eof}));
}

TEST(SyntaxLexer, QuestionDotBeforeDigitIsConditional)
{
  EXPECT_EQ(
    kinds("a?.5:b"),
    (std::vector<TokenKind>{
      TokenKind::Identifier, TokenKind::Question, TokenKind::NumericLiteral, TokenKind::Colon,
      TokenKind::Identifier, TokenKind::Eof}));
}

TEST(SyntaxLexer, TemplateLiteralPieces)
{
  Lexer lex("`a${x}b${y}c`");
  const Token head = lex.next();
  EXPECT_EQ(head.kind, TokenKind::TemplateHead);
  EXPECT_EQ(head.text, "`a${");

  EXPECT_TRUE(lex.next().is_word("x"));
  const Token mid = lex.rescan_template_continuation(lex.next());
  EXPECT_EQ(mid.kind, TokenKind::TemplateMiddle);
  EXPECT_EQ(mid.text, "}b${");

  EXPECT_TRUE(lex.next().is_word("y"));
  const Token tail = lex.rescan_template_continuation(lex.next());
  EXPECT_EQ(tail.kind, TokenKind::TemplateTail);
  EXPECT_EQ(tail.text, "}c`");

  Lexer plain("`plain`");
  EXPECT_EQ(plain.next().kind, TokenKind::NoSubstitutionTemplate);
}

TEST(SyntaxLexer, RegexRescan)
{
  Lexer lex("/[/]+/gi.test(s)");
  const Token slash = lex.next();
  ASSERT_EQ(slash.kind, TokenKind::Slash);
  const Token re = lex.rescan_as_regex(slash);
  EXPECT_EQ(re.kind, TokenKind::RegexLiteral);
  EXPECT_EQ(re.text, "/[/]+/gi");
  EXPECT_EQ(lex.next().kind, TokenKind::Dot);
}

TEST(SyntaxLexer, JsxRescans)
{
  const std::string_view src = "<a data-id=\"x\ny\">hi {n}</a>";
  Lexer lex(src);

  EXPECT_EQ(lex.next().kind, TokenKind::Lt);
  EXPECT_TRUE(lex.next().is_word("a"));
  const Token name = lex.rescan_jsx_identifier(lex.next());
  EXPECT_EQ(name.text, "data-id");
  EXPECT_EQ(lex.next().kind, TokenKind::Eq);

  // Ordinary string rules stop at the newline; JSX strings may span lines.
  const Token value = lex.rescan_jsx_string(lex.next());
  EXPECT_EQ(value.kind, TokenKind::StringLiteral);
  EXPECT_EQ(value.text, "\"x\ny\"");
  EXPECT_EQ(lex.next().kind, TokenKind::Gt);

  const Token text = lex.rescan_jsx_child(lex.position());
  EXPECT_EQ(text.kind, TokenKind::JsxText);
  EXPECT_EQ(text.text, "hi ");
  EXPECT_EQ(lex.rescan_jsx_child(lex.position()).kind, TokenKind::LBrace);
}

TEST(SyntaxLexer, SplitsCompoundGreaterThan)
{
  Lexer lex(">>=");
  const Token t = lex.next();
  ASSERT_EQ(t.kind, TokenKind::GtGtEq);
  const Token gt = lex.rescan_single_gt(t);
  EXPECT_EQ(gt.kind, TokenKind::Gt);
  EXPECT_EQ(lex.next().kind, TokenKind::GtEq);
}

TEST(SyntaxLexer, PrivateNames)
{
  Lexer lex("this.#count");
  EXPECT_TRUE(lex.next().is_word("this"));
  EXPECT_EQ(lex.next().kind, TokenKind::Dot);
  const Token t = lex.next();
  EXPECT_EQ(t.kind, TokenKind::PrivateName);
  EXPECT_EQ(t.text, "#count");
}
