#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "mathedit/config/engine_config.hpp"

namespace fs = std::filesystem;

using mathedit::load_engine_config;
using mathedit::load_engine_config_from_string;

namespace
{

class TempDir
{
public:
  explicit TempDir(const std::string & name)
  : path_(fs::temp_directory_path() / ("mathedit_test_" + name))
  {
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() { fs::remove_all(path_); }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path & path() const { return path_; }

  void write(const fs::path & rel, const std::string & text) const
  {
    fs::create_directories((path_ / rel).parent_path());
    std::ofstream(path_ / rel) << text;
  }

private:
  fs::path path_;
};

}  // namespace

TEST(EngineConfig, EmptyDocumentGivesDefaults)
{
  const auto r = load_engine_config_from_string("");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.limits.max_length, 10000U);
  EXPECT_EQ(r.config.limits.max_nesting_depth, 50U);
  EXPECT_EQ(r.config.limits.max_rows, 100U);
  EXPECT_EQ(r.config.sync.textual_debounce_ms, 300U);
  EXPECT_EQ(r.config.sync.structural_debounce_ms, 100U);
  EXPECT_EQ(r.config.sync.history_depth, 50U);
  EXPECT_TRUE(r.config.commands.is_allowed("frac"));
  EXPECT_TRUE(r.config.templates.empty());
}

TEST(EngineConfig, RejectsOverlappingLists)
{
  const auto r = load_engine_config_from_string(R"(
limits:
  max_length: 2000
  max_nesting_depth: 10
  max_rows: 8
  max_cols: 9
commands:
  allow_extra: ["\\mathring", overbrace]
  deny: [input, href, color]
sync:
  textual_debounce_ms: 250
  structural_debounce_ms: 50
  history_depth: 5
templates:
  - name: half
    markup: "\\frac{}{2}"
)");
  // color is in the default allow-list
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("color"), std::string::npos) << r.error;
}

TEST(EngineConfig, ReadsLimitsSyncAndTemplates)
{
  const auto r = load_engine_config_from_string(R"(
limits:
  max_length: 2000
  max_nesting_depth: 10
  max_rows: 8
  max_cols: 9
commands:
  allow_extra: ["\\mathring", overbrace]
sync:
  textual_debounce_ms: 250
  structural_debounce_ms: 50
  history_depth: 5
  compaction_threshold: 1000
templates:
  - name: half
    markup: "\\frac{}{2}"
)");
  ASSERT_TRUE(r.success) << r.error;
  const auto & c = r.config;
  EXPECT_EQ(c.limits.max_length, 2000U);
  EXPECT_EQ(c.limits.max_nesting_depth, 10U);
  EXPECT_EQ(c.limits.max_rows, 8U);
  EXPECT_EQ(c.limits.max_cols, 9U);
  EXPECT_TRUE(c.commands.is_allowed("mathring"));
  EXPECT_TRUE(c.commands.is_allowed("overbrace"));
  EXPECT_TRUE(c.commands.is_allowed("frac"));
  EXPECT_TRUE(c.commands.is_denied("input"));
  EXPECT_EQ(c.sync.textual_debounce_ms, 250U);
  EXPECT_EQ(c.sync.structural_debounce_ms, 50U);
  EXPECT_EQ(c.sync.history_depth, 5U);
  EXPECT_EQ(c.sync.compaction_threshold, 1000U);
  ASSERT_EQ(c.templates.size(), 1U);
  EXPECT_EQ(c.templates[0].name, "half");
  EXPECT_EQ(c.templates[0].markup, "\\frac{}{2}");
}

TEST(EngineConfig, AllowReplacesDefaults)
{
  const auto r = load_engine_config_from_string("commands:\n  allow: [frac]\n");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.commands.is_allowed("frac"));
  EXPECT_FALSE(r.config.commands.is_allowed("sqrt"));
  EXPECT_TRUE(r.config.commands.is_denied("input"));
}

TEST(EngineConfig, RejectsBadValues)
{
  EXPECT_FALSE(load_engine_config_from_string("limits:\n  max_length: 0\n").success);
  EXPECT_FALSE(load_engine_config_from_string("limits:\n  max_rows: many\n").success);
  EXPECT_FALSE(load_engine_config_from_string("commands:\n  deny: input\n").success);
  EXPECT_FALSE(load_engine_config_from_string("commands:\n  allow: ['\\']\n").success);
  EXPECT_FALSE(load_engine_config_from_string("- a\n- b\n").success);
  EXPECT_FALSE(load_engine_config_from_string("limits: [unclosed\n").success);
}

TEST(EngineConfig, RejectsTemplateProblems)
{
  const auto dup = load_engine_config_from_string(R"(
templates:
  - {name: a, markup: "x"}
  - {name: a, markup: "y"}
)");
  ASSERT_FALSE(dup.success);
  EXPECT_NE(dup.error.find("duplicate template name"), std::string::npos);

  EXPECT_FALSE(load_engine_config_from_string("templates:\n  - {name: a}\n").success);
  EXPECT_FALSE(load_engine_config_from_string("templates: {name: a}\n").success);
}

TEST(EngineConfig, LoadsFileAndRecordsRoot)
{
  const TempDir dir("load");
  dir.write("mathedit.yaml", "limits:\n  max_rows: 3\n");

  const auto r = load_engine_config(dir.path() / "mathedit.yaml");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.limits.max_rows, 3U);
  EXPECT_EQ(r.config.config_root, fs::absolute(dir.path()));

  const auto missing = load_engine_config(dir.path() / "nope.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_NE(missing.error.find("not found"), std::string::npos);
}

TEST(EngineConfig, FindSearchesUpward)
{
  const TempDir dir("find");
  dir.write("mathedit.yaml", "");
  dir.write("a/b/formula.tex", "x");

  const auto found = mathedit::find_engine_config(dir.path() / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(dir.path() / "mathedit.yaml"));

  const auto from_file = mathedit::find_engine_config(dir.path() / "a" / "b" / "formula.tex");
  ASSERT_TRUE(from_file.has_value());
  EXPECT_EQ(fs::canonical(*from_file), fs::canonical(dir.path() / "mathedit.yaml"));
}
