#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mathedit/edit/template_library.hpp"
#include "mathedit/syntax/serializer.hpp"

using mathedit::ErrorKind;
using mathedit::TemplateConfig;
using mathedit::TemplateLibrary;
using mathedit::Validator;

TEST(TemplateLibrary, BuiltinsAllLoad)
{
  const Validator v;
  TemplateLibrary lib;
  const auto builtins = TemplateLibrary::builtin_templates();
  const auto rejected = lib.load(builtins, v);

  EXPECT_TRUE(rejected.empty());
  EXPECT_EQ(lib.size(), builtins.size());

  const auto * frac = lib.find("fraction");
  ASSERT_NE(frac, nullptr);
  EXPECT_EQ(frac->placeholder_count, 2U);
  EXPECT_EQ(mathedit::serialize(frac->tree), "\\frac{}{}");

  EXPECT_EQ(lib.find("matrix2")->placeholder_count, 4U);
  EXPECT_EQ(lib.find("definite_integral")->placeholder_count, 3U);
  EXPECT_EQ(lib.find("color")->placeholder_count, 1U);
  EXPECT_EQ(lib.find("missing"), nullptr);
}

TEST(TemplateLibrary, RejectsUnsafeAndDisallowedEntries)
{
  const Validator v;
  TemplateLibrary lib;
  const std::vector<TemplateConfig> entries = {
    {"ok", "\\frac{}{x}"},
    {"leak", "\\input{secrets}"},
    {"script", "<script>alert(1)</script>"},
    {"ok", "\\sqrt{}"},
  };
  const auto rejected = lib.load(entries, v);

  ASSERT_EQ(lib.size(), 1U);
  EXPECT_EQ(lib.templates()[0].markup, "\\frac{}{x}");

  EXPECT_TRUE(rejected.has_kind(ErrorKind::DisallowedCommand));
  EXPECT_TRUE(rejected.has_kind(ErrorKind::UnsafeContent));

  bool saw_duplicate = false;
  for (const auto & d : rejected) {
    if (d.message.find("duplicate template name 'ok'") != std::string::npos) {
      saw_duplicate = true;
    }
  }
  EXPECT_TRUE(saw_duplicate);
}

TEST(TemplateLibrary, ReportsMalformedMarkup)
{
  const Validator v;
  TemplateLibrary lib;
  const auto rejected = lib.load({{"broken", "\\frac{"}}, v);
  EXPECT_EQ(lib.size(), 0U);
  ASSERT_FALSE(rejected.empty());
  EXPECT_NE(rejected.errors()[0].message.find("template 'broken'"), std::string::npos);
}

TEST(TemplateLibrary, ReloadReplacesContents)
{
  const Validator v;
  TemplateLibrary lib;
  (void)lib.load(TemplateLibrary::builtin_templates(), v);
  ASSERT_GT(lib.size(), 1U);

  (void)lib.load({{"only", "x^{}"}}, v);
  EXPECT_EQ(lib.size(), 1U);
  EXPECT_EQ(lib.find("fraction"), nullptr);
  EXPECT_EQ(lib.find("only")->placeholder_count, 1U);
}
