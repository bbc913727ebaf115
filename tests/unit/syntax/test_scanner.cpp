#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "mathedit/syntax/commands.hpp"
#include "mathedit/syntax/scanner.hpp"
#include "mathedit/syntax/token.hpp"

using mathedit::syntax::scan;
using mathedit::syntax::Token;
using mathedit::syntax::TokenKind;

namespace
{

std::vector<TokenKind> kinds(std::string_view src)
{
  std::vector<TokenKind> out;
  for (const Token & t : scan(src)) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxScanner, FractionTokens)
{
  const auto toks = scan("\\frac{a}{b}");
  ASSERT_EQ(toks.size(), 8U);
  EXPECT_EQ(toks[0].kind, TokenKind::Command);
  EXPECT_EQ(toks[0].text, "frac");
  EXPECT_EQ(toks[0].range, mathedit::SourceRange(0, 5));
  EXPECT_EQ(toks[1].kind, TokenKind::OpenGroup);
  EXPECT_EQ(toks[2].kind, TokenKind::Literal);
  EXPECT_EQ(toks[2].text, "a");
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
  EXPECT_EQ(toks.back().range, mathedit::SourceRange(11, 11));
}

TEST(SyntaxScanner, LiteralRuns)
{
  const auto toks = scan("3.14abc+2.");
  ASSERT_EQ(toks.size(), 6U);
  EXPECT_EQ(toks[0].text, "3.14");
  EXPECT_EQ(toks[1].text, "abc");
  EXPECT_EQ(toks[2].text, "+");
  EXPECT_EQ(toks[3].text, "2");
  EXPECT_EQ(toks[4].text, ".");
}

TEST(SyntaxScanner, ScriptsAndSeparators)
{
  EXPECT_EQ(
    kinds("x^2_i & y \\\\ z"),
    (std::vector<TokenKind>{
      TokenKind::Literal, TokenKind::SuperscriptMarker, TokenKind::Literal,
      TokenKind::SubscriptMarker, TokenKind::Literal, TokenKind::ColumnSeparator,
      TokenKind::Literal, TokenKind::RowSeparator, TokenKind::Literal, TokenKind::Eof}));
}

TEST(SyntaxScanner, EnvironmentsCarryTheirName)
{
  const auto toks = scan("\\begin{pmatrix}a\\end {pmatrix}");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::EnvironmentBegin);
  EXPECT_EQ(toks[0].text, "pmatrix");
  EXPECT_EQ(toks[2].kind, TokenKind::EnvironmentEnd);
  EXPECT_EQ(toks[2].text, "pmatrix");
}

TEST(SyntaxScanner, BeginWithoutNameIsACommand)
{
  const auto toks = scan("\\begin x");
  ASSERT_GE(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::Command);
  EXPECT_EQ(toks[0].text, "begin");
}

TEST(SyntaxScanner, CommandNameFoundPastWhitespaceAndComments)
{
  // What a renderer would also read as \input
  for (const std::string_view src : {"\\ input", "\\\n\tinput", "\\%hidden\ninput"}) {
    const auto toks = scan(src);
    ASSERT_GE(toks.size(), 2U) << src;
    EXPECT_EQ(toks[0].kind, TokenKind::Command) << src;
    EXPECT_EQ(toks[0].text, "input") << src;
  }
}

TEST(SyntaxScanner, ControlSymbols)
{
  const auto toks = scan("\\{\\,\\");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::ControlSymbol);
  EXPECT_EQ(toks[0].text, "{");
  EXPECT_EQ(toks[1].text, ",");
  // Lone trailing backslash
  EXPECT_EQ(toks[2].kind, TokenKind::ControlSymbol);
  EXPECT_TRUE(toks[2].text.empty());
}

TEST(SyntaxScanner, CommentsAreTokens)
{
  const auto toks = scan("x % note\r\ny");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[1].kind, TokenKind::Comment);
  EXPECT_EQ(toks[1].text, " note");
  EXPECT_EQ(toks[2].text, "y");
}

TEST(SyntaxScanner, Utf8StaysInOneLiteral)
{
  const auto toks = scan("\xCE\xB1\xCE\xB2");
  ASSERT_EQ(toks.size(), 2U);
  EXPECT_EQ(toks[0].text, "\xCE\xB1\xCE\xB2");
}

TEST(SyntaxCommands, Classification)
{
  using mathedit::syntax::classify_command;
  using mathedit::syntax::CommandClass;

  EXPECT_EQ(classify_command("frac"), CommandClass::Fraction);
  EXPECT_EQ(classify_command("binom"), CommandClass::Fraction);
  EXPECT_EQ(classify_command("sqrt"), CommandClass::Root);
  EXPECT_EQ(classify_command("oint"), CommandClass::BigOperator);
  EXPECT_EQ(classify_command("text"), CommandClass::Text);
  EXPECT_EQ(classify_command("mathbf"), CommandClass::Format);
  EXPECT_EQ(classify_command("textcolor"), CommandClass::ColoredFormat);
  EXPECT_EQ(classify_command("alpha"), CommandClass::Symbol);
  EXPECT_EQ(classify_command("cdot"), CommandClass::Operator);
  EXPECT_EQ(classify_command("left"), CommandClass::Delimiter);
  EXPECT_EQ(classify_command("sin"), CommandClass::Function);
  EXPECT_EQ(classify_command("nonsense"), CommandClass::Function);

  EXPECT_EQ(mathedit::syntax::big_operator_kind("sum"), mathedit::ExprKind::Sum);
  EXPECT_EQ(mathedit::syntax::big_operator_kind("limsup"), mathedit::ExprKind::Limit);
  EXPECT_EQ(mathedit::syntax::big_operator_kind("iint"), mathedit::ExprKind::Integral);
  EXPECT_FALSE(mathedit::syntax::is_known_command("sin"));
}
