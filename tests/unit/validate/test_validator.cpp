#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "mathedit/validate/patterns.hpp"
#include "mathedit/validate/validator.hpp"

using mathedit::ErrorKind;
using mathedit::Limits;
using mathedit::ValidationError;
using mathedit::Validator;

namespace
{

bool has_kind(const std::vector<ValidationError> & errors, ErrorKind kind)
{
  return std::any_of(
    errors.begin(), errors.end(), [&](const ValidationError & e) { return e.kind == kind; });
}

std::string nested_fractions(int levels)
{
  std::string out;
  for (int i = 0; i < levels; ++i) out += "\\frac{";
  out += "x";
  for (int i = 0; i < levels; ++i) out += "}{y}";
  return out;
}

std::string square_matrix(int n)
{
  std::string out = "\\begin{pmatrix}";
  for (int r = 0; r < n; ++r) {
    if (r > 0) out += "\\\\";
    for (int c = 0; c < n; ++c) {
      if (c > 0) out += "&";
      out += "1";
    }
  }
  out += "\\end{pmatrix}";
  return out;
}

Validator roomy_validator()
{
  Limits limits;
  limits.max_length = 100000;
  return Validator(limits, mathedit::CommandPolicy::defaults());
}

}  // namespace

TEST(Validator, AcceptsOrdinaryFormula)
{
  const Validator v;
  const auto result = v.validate("\\frac{a}{b} + \\sqrt{x^2}");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result.value(), "\\frac{a}{b} + \\sqrt{x^2}");
  EXPECT_TRUE(v.inspect("\\sum_{i=1}^{n} i").empty());
}

TEST(Validator, NestingCeiling)
{
  const Validator v;
  EXPECT_TRUE(v.inspect(nested_fractions(50)).empty());

  const auto errors = v.inspect(nested_fractions(51));
  ASSERT_TRUE(has_kind(errors, ErrorKind::TooDeep));
  EXPECT_EQ(errors.size(), 1U);
}

TEST(Validator, HostileNestingIsReportedOnce)
{
  const Validator v;
  const auto errors = v.inspect(nested_fractions(400));
  EXPECT_EQ(
    std::count_if(
      errors.begin(), errors.end(),
      [](const ValidationError & e) { return e.kind == ErrorKind::TooDeep; }),
    1);
}

TEST(Validator, LongScriptChainWithRaisedLengthLimit)
{
  Limits limits;
  limits.max_length = 10'000'000;
  const Validator v(limits, mathedit::CommandPolicy::defaults());

  std::string chain;
  for (int i = 0; i < 200000; ++i) chain += "x^{";
  chain += "x";
  chain.append(200000, '}');

  const auto errors = v.inspect(chain);
  EXPECT_EQ(
    std::count_if(
      errors.begin(), errors.end(),
      [](const ValidationError & e) { return e.kind == ErrorKind::TooDeep; }),
    1);
  EXPECT_FALSE(has_kind(errors, ErrorKind::TooLong));
}

TEST(Validator, CheckLengthMatchesLimit)
{
  Limits limits;
  limits.max_length = 4;
  const Validator v(limits, mathedit::CommandPolicy::defaults());
  EXPECT_FALSE(v.check_length("abcd").has_value());
  const auto error = v.check_length("abcde");
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::TooLong);
}

TEST(Validator, ScriptPayloadIsUnsafe)
{
  const Validator v;
  const std::string markup = "x + <script>alert(1)</script> y";
  const auto result = v.validate(markup);
  ASSERT_TRUE(result.has_error());
  EXPECT_TRUE(has_kind(result.error(), ErrorKind::UnsafeContent));

  const ValidationError & first = result.error().front();
  EXPECT_EQ(first.subject, "ScriptPayload");
  EXPECT_EQ(first.range.get_begin().get_offset(), 4U);

  EXPECT_EQ(Validator::sanitize(markup), "x +  y");
}

TEST(Validator, EventHandlerAndProtocolAreUnsafe)
{
  const Validator v;
  EXPECT_TRUE(has_kind(v.inspect("<b onclick=\"x()\">a</b>"), ErrorKind::UnsafeContent));
  EXPECT_TRUE(has_kind(v.inspect("\\text{javascript:alert(1)}"), ErrorKind::UnsafeContent));
  EXPECT_TRUE(has_kind(v.inspect("<iframe src=x>"), ErrorKind::UnsafeContent));
}

TEST(Validator, FileIncludeIsDisallowed)
{
  const Validator v;
  const auto errors = v.inspect("\\input{/etc/passwd}");
  ASSERT_TRUE(has_kind(errors, ErrorKind::DisallowedCommand));

  const auto it = std::find_if(errors.begin(), errors.end(), [](const ValidationError & e) {
    return e.kind == ErrorKind::DisallowedCommand;
  });
  EXPECT_EQ(it->subject, "input");
  EXPECT_NE(it->message.find("forbidden"), std::string::npos) << it->message;
}

TEST(Validator, UnknownCommandIsNotAllowed)
{
  const Validator v;
  const auto errors = v.inspect("\\foo{x} + \\foo{y}");
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].kind, ErrorKind::DisallowedCommand);
  EXPECT_EQ(errors[0].subject, "foo");
  EXPECT_NE(errors[0].message.find("not allowed"), std::string::npos);
}

TEST(Validator, DisallowedEnvironment)
{
  const Validator v;
  EXPECT_TRUE(has_kind(v.inspect("\\begin{tabular}{c} a \\end{tabular}"), ErrorKind::DisallowedCommand));
  EXPECT_TRUE(v.inspect("\\begin{align*} a \\end{align*}").empty());
}

TEST(Validator, DenyListIgnoresCaseAndSpacing)
{
  const Validator v;
  EXPECT_TRUE(has_kind(v.inspect("\\INPUT{x}"), ErrorKind::DisallowedCommand));
  EXPECT_TRUE(has_kind(v.inspect("\\ input{x}"), ErrorKind::UnsafeContent));
  EXPECT_TRUE(has_kind(v.inspect("\\%\n input{x}"), ErrorKind::UnsafeContent));
}

TEST(Validator, MatrixCeiling)
{
  const Validator v = roomy_validator();
  EXPECT_TRUE(v.inspect(square_matrix(100)).empty());

  const auto errors = v.inspect(square_matrix(101));
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].kind, ErrorKind::MatrixTooLarge);
  EXPECT_NE(errors[0].message.find("101x101"), std::string::npos) << errors[0].message;
}

TEST(Validator, LengthCeiling)
{
  const Validator v;
  const std::string longest(Limits::k_default_max_length, 'x');
  EXPECT_TRUE(v.inspect(longest).empty());

  const auto errors = v.inspect(longest + "x");
  ASSERT_EQ(errors.size(), 1U);
  EXPECT_EQ(errors[0].kind, ErrorKind::TooLong);
  EXPECT_FALSE(errors[0].range.is_valid());
}

TEST(Validator, StructuralErrorsSurface)
{
  const Validator v;
  EXPECT_TRUE(has_kind(v.inspect("\\frac{a"), ErrorKind::UnbalancedGroup));
  EXPECT_TRUE(has_kind(v.inspect("\\frac"), ErrorKind::ArityMismatch));
}

TEST(Validator, ViolationsAreReportedIndependently)
{
  const Validator v;
  const auto errors = v.inspect("<script>x</script> \\input{y} \\frac{a");
  EXPECT_TRUE(has_kind(errors, ErrorKind::UnsafeContent));
  EXPECT_TRUE(has_kind(errors, ErrorKind::DisallowedCommand));
  EXPECT_TRUE(has_kind(errors, ErrorKind::UnbalancedGroup));
}

TEST(Validator, ToDiagnosticCarriesCodeAndLabel)
{
  const Validator v;
  const auto errors = v.inspect("a + \\foo");
  ASSERT_EQ(errors.size(), 1U);
  const mathedit::Diagnostic d = mathedit::to_diagnostic(errors[0]);
  EXPECT_TRUE(d.kind() == ErrorKind::DisallowedCommand);
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_range().get_begin().get_offset(), 4U);
}

// ============================================================================
// Sanitize
// ============================================================================

TEST(Sanitize, SafeMarkupIsUnchanged)
{
  const std::string markup = "\\frac{a}{b} < c";
  EXPECT_EQ(Validator::sanitize(markup), markup);
}

TEST(Sanitize, DangerousCommandLeavesEmptyGroup)
{
  EXPECT_EQ(Validator::sanitize("a + \\input{secret} + b"), "a + {} + b");
  EXPECT_EQ(Validator::sanitize("\\frac{\\INPUT{f}}{2}"), "\\frac{{}}{2}");
  EXPECT_EQ(Validator::sanitize("\\usepackage{evil}x"), "{}x");
}

TEST(Sanitize, RemovesProtocolAndHandlers)
{
  EXPECT_EQ(Validator::sanitize("\\text{javascript:go}"), "\\text{go}");
  EXPECT_EQ(Validator::sanitize("<iframe>a"), "a");
}

TEST(Sanitize, ReachesFixedPoint)
{
  // Removing the inner tag reassembles an outer one
  const std::string layered = "<scr<script>x</script>ipt>alert(1)</script>";
  const std::string once = Validator::sanitize(layered);
  EXPECT_EQ(Validator::sanitize(once), once);
  EXPECT_EQ(once.find("script"), std::string::npos) << once;

  for (const char * markup : {
         "a + \\input{b}", "<script>x</script>", "\\def\\x{1}", "<b onload=go()>t</b>",
         "\\ include % c\n {f}"}) {
    const std::string s = Validator::sanitize(markup);
    EXPECT_EQ(Validator::sanitize(s), s) << markup;
    EXPECT_FALSE(mathedit::PatternSet::builtin().matches_any(s)) << markup;
  }
}
