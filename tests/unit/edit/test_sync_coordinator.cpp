#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "mathedit/basic/casting.hpp"
#include "mathedit/edit/sync_coordinator.hpp"
#include "mathedit/edit/template_library.hpp"

using mathedit::EditSource;
using mathedit::ErrorKind;
using mathedit::ManualScheduler;
using mathedit::Millis;
using mathedit::Path;
using mathedit::SyncConfig;
using mathedit::SyncCoordinator;
using mathedit::SyncState;
using mathedit::Validator;

namespace
{

SyncConfig fast_config()
{
  SyncConfig cfg;
  cfg.textual_debounce_ms = 30;
  cfg.structural_debounce_ms = 20;
  return cfg;
}

class SyncCoordinatorTest : public ::testing::Test
{
protected:
  ManualScheduler scheduler;
  SyncCoordinator coord{scheduler, Validator{}, fast_config()};
};

}  // namespace

TEST_F(SyncCoordinatorTest, StartsWithSinglePlaceholder)
{
  ASSERT_NE(coord.root(), nullptr);
  EXPECT_TRUE(mathedit::isa<mathedit::PlaceholderExpr>(coord.root()));
  EXPECT_EQ(coord.focus(), Path{});
  EXPECT_EQ(coord.markup(), "{}");
  EXPECT_EQ(coord.state(), SyncState::Idle);
  EXPECT_FALSE(coord.last_commit().has_value());
}

TEST_F(SyncCoordinatorTest, LoadSetsTreeAndClearsHistory)
{
  ASSERT_TRUE(coord.load("\\frac{}{}"));
  EXPECT_EQ(coord.markup(), "\\frac{}{}");
  EXPECT_EQ(coord.text_view(), "\\frac{}{}");
  EXPECT_EQ(coord.focus(), (Path{0}));
  EXPECT_FALSE(coord.can_undo());
  ASSERT_TRUE(coord.last_commit().has_value());
  EXPECT_EQ(coord.last_commit()->source, EditSource::Textual);
}

TEST_F(SyncCoordinatorTest, RejectedLoadKeepsTree)
{
  ASSERT_TRUE(coord.load("\\frac{a}{b}"));
  std::vector<std::string> seen;
  coord.set_callbacks({nullptr, nullptr, nullptr, [&](const mathedit::Diagnostic & d) {
                         seen.push_back(d.message);
                       }});

  EXPECT_FALSE(coord.load("\\input{/etc/passwd}"));
  EXPECT_EQ(coord.markup(), "\\frac{a}{b}");
  EXPECT_TRUE(coord.notices().has_kind(ErrorKind::DisallowedCommand));
  EXPECT_FALSE(seen.empty());

  coord.clear_notices();
  EXPECT_TRUE(coord.notices().empty());
}

TEST_F(SyncCoordinatorTest, TooDeepTextKeepsPriorTree)
{
  ASSERT_TRUE(coord.load("\\sqrt{x}"));
  std::string deep;
  for (int i = 0; i < 51; ++i) deep += "\\frac{";
  deep += "1";
  for (int i = 0; i < 51; ++i) deep += "}{2}";

  coord.text_changed(deep);
  scheduler.advance(Millis{30});
  EXPECT_EQ(coord.markup(), "\\sqrt{x}");
  EXPECT_TRUE(coord.notices().has_kind(ErrorKind::TooDeep));
  EXPECT_FALSE(coord.can_undo());
}

TEST_F(SyncCoordinatorTest, StructuralEditRefreshesTextAfterDebounce)
{
  ASSERT_TRUE(coord.load("\\frac{}{}"));
  std::vector<std::string> refreshed;
  std::vector<std::string> rendered;
  mathedit::SyncCallbacks cb;
  cb.on_markup = [&](std::string_view m) { refreshed.emplace_back(m); };
  cb.on_render = [&](std::string_view m) { rendered.emplace_back(m); };
  coord.set_callbacks(cb);

  ASSERT_TRUE(coord.fill({0}, "a"));
  EXPECT_EQ(coord.markup(), "\\frac{a}{}");
  EXPECT_EQ(rendered, std::vector<std::string>{"\\frac{a}{}"});
  EXPECT_EQ(coord.focus(), (Path{1}));

  // Text view lags until the debounce elapses
  EXPECT_EQ(coord.text_view(), "\\frac{}{}");
  EXPECT_TRUE(coord.refresh_pending());

  scheduler.advance(Millis{10});
  ASSERT_TRUE(coord.fill({1}, "b"));
  scheduler.advance(Millis{19});
  EXPECT_TRUE(refreshed.empty());

  scheduler.advance(Millis{1});
  EXPECT_EQ(refreshed, std::vector<std::string>{"\\frac{a}{b}"});
  EXPECT_EQ(coord.text_view(), "\\frac{a}{b}");
  EXPECT_FALSE(coord.refresh_pending());
}

TEST_F(SyncCoordinatorTest, TextualEditDebouncesToLastChange)
{
  int trees = 0;
  mathedit::SyncCallbacks cb;
  cb.on_tree = [&](const mathedit::Expr *) { ++trees; };
  coord.set_callbacks(cb);

  coord.text_changed("\\frac{1}");
  scheduler.advance(Millis{20});
  coord.text_changed("\\frac{1}{2}");
  EXPECT_EQ(coord.text_view(), "\\frac{1}{2}");

  scheduler.advance(Millis{29});
  EXPECT_EQ(trees, 0);
  EXPECT_TRUE(coord.reparse_pending());

  scheduler.advance(Millis{1});
  EXPECT_EQ(trees, 1);
  EXPECT_EQ(coord.markup(), "\\frac{1}{2}");
  EXPECT_FALSE(coord.reparse_pending());
  EXPECT_EQ(coord.last_commit()->at, Millis{50});
  EXPECT_TRUE(coord.can_undo());
}

TEST_F(SyncCoordinatorTest, InvalidTextKeepsLastGoodTree)
{
  ASSERT_TRUE(coord.load("x^2"));
  coord.text_changed("\\frac{x");
  scheduler.advance(Millis{30});

  EXPECT_EQ(coord.markup(), "x^{2}");
  EXPECT_EQ(coord.text_view(), "\\frac{x");
  EXPECT_TRUE(coord.notices().has_kind(ErrorKind::UnbalancedGroup));
}

TEST_F(SyncCoordinatorTest, LaterTextualCompletionWins)
{
  ASSERT_TRUE(coord.load("\\frac{}{b}"));
  int refreshes = 0;
  mathedit::SyncCallbacks cb;
  cb.on_markup = [&](std::string_view) { ++refreshes; };
  coord.set_callbacks(cb);

  scheduler.advance_to(Millis{90});
  coord.text_changed("\\frac{c}{d}");

  scheduler.advance_to(Millis{100});
  ASSERT_TRUE(coord.fill({0}, "a"));
  EXPECT_EQ(coord.markup(), "\\frac{a}{b}");
  EXPECT_EQ(coord.last_commit()->at, Millis{100});

  scheduler.advance_to(Millis{120});
  EXPECT_EQ(coord.markup(), "\\frac{c}{d}");
  EXPECT_EQ(coord.text_view(), "\\frac{c}{d}");
  ASSERT_TRUE(coord.last_commit().has_value());
  EXPECT_EQ(coord.last_commit()->source, EditSource::Textual);
  EXPECT_EQ(coord.last_commit()->at, Millis{120});
  EXPECT_FALSE(coord.refresh_pending());

  scheduler.advance_to(Millis{500});
  EXPECT_EQ(refreshes, 0);
  EXPECT_EQ(coord.markup(), "\\frac{c}{d}");

  // The structural result is still one undo away
  ASSERT_TRUE(coord.undo());
  EXPECT_EQ(coord.markup(), "\\frac{a}{b}");
}

TEST_F(SyncCoordinatorTest, LaterStructuralCompletionWins)
{
  ASSERT_TRUE(coord.load("\\frac{}{}"));
  coord.text_changed("\\frac{}{y}");
  scheduler.advance_to(Millis{30});
  ASSERT_EQ(coord.markup(), "\\frac{}{y}");

  scheduler.advance_to(Millis{40});
  ASSERT_TRUE(coord.fill({0}, "x"));
  scheduler.advance_to(Millis{60});

  EXPECT_EQ(coord.markup(), "\\frac{x}{y}");
  EXPECT_EQ(coord.text_view(), "\\frac{x}{y}");
  EXPECT_EQ(coord.last_commit()->source, EditSource::Structural);
}

TEST_F(SyncCoordinatorTest, TypingCancelsPendingRefresh)
{
  ASSERT_TRUE(coord.load("a"));
  std::vector<std::string> refreshed;
  mathedit::SyncCallbacks cb;
  cb.on_markup = [&](std::string_view m) { refreshed.emplace_back(m); };
  coord.set_callbacks(cb);

  ASSERT_TRUE(coord.insert_markup("b"));
  EXPECT_EQ(coord.markup(), "a{b}");
  EXPECT_TRUE(coord.refresh_pending());

  scheduler.advance(Millis{10});
  coord.text_changed("\\frac{x}{y}");
  EXPECT_FALSE(coord.refresh_pending());

  scheduler.advance(Millis{15});
  EXPECT_TRUE(refreshed.empty());
  EXPECT_EQ(coord.text_view(), "\\frac{x}{y}");

  scheduler.advance(Millis{300});
  EXPECT_EQ(coord.markup(), "\\frac{x}{y}");
  EXPECT_EQ(coord.markup(), coord.text_view());
  EXPECT_TRUE(refreshed.empty());
}

TEST_F(SyncCoordinatorTest, TextualCommitRestoresOverwrittenTextView)
{
  ASSERT_TRUE(coord.load("a"));
  std::vector<std::string> refreshed;
  mathedit::SyncCallbacks cb;
  cb.on_markup = [&](std::string_view m) { refreshed.emplace_back(m); };
  coord.set_callbacks(cb);

  coord.text_changed("\\frac{x}{y}");
  scheduler.advance(Millis{5});
  ASSERT_TRUE(coord.insert_markup("b"));

  // The structural refresh lands first, then the reparse commits later
  scheduler.advance(Millis{20});
  EXPECT_EQ(coord.text_view(), "a{b}");

  scheduler.advance(Millis{5});
  EXPECT_EQ(coord.markup(), "\\frac{x}{y}");
  EXPECT_EQ(coord.text_view(), coord.markup());
  EXPECT_EQ(refreshed, (std::vector<std::string>{"a{b}", "\\frac{x}{y}"}));
}

TEST_F(SyncCoordinatorTest, UndoRedo)
{
  ASSERT_TRUE(coord.load("\\frac{}{}"));
  ASSERT_TRUE(coord.fill({0}, "a"));
  ASSERT_TRUE(coord.fill({1}, "b"));

  ASSERT_TRUE(coord.undo());
  EXPECT_EQ(coord.markup(), "\\frac{a}{}");
  ASSERT_TRUE(coord.undo());
  EXPECT_EQ(coord.markup(), "\\frac{}{}");
  EXPECT_FALSE(coord.undo());

  ASSERT_TRUE(coord.redo());
  EXPECT_EQ(coord.markup(), "\\frac{a}{}");
  EXPECT_TRUE(coord.can_redo());

  ASSERT_TRUE(coord.fill({1}, "c"));
  EXPECT_FALSE(coord.can_redo());
  EXPECT_FALSE(coord.redo());
  EXPECT_EQ(coord.markup(), "\\frac{a}{c}");
}

TEST_F(SyncCoordinatorTest, EditFromCallbackIsQueued)
{
  bool nested_result = false;
  bool done = false;
  std::vector<SyncState> states;
  mathedit::SyncCallbacks cb;
  cb.on_tree = [&](const mathedit::Expr *) {
    states.push_back(coord.state());
    if (!done) {
      done = true;
      nested_result = coord.insert_markup("y");
      // Still the first edit's tree
      EXPECT_EQ(coord.markup(), "\\frac{}{}");
    }
  };
  coord.set_callbacks(cb);

  ASSERT_TRUE(coord.load("\\frac{}{}"));
  EXPECT_TRUE(nested_result);
  EXPECT_EQ(coord.markup(), "\\frac{y}{}");
  EXPECT_EQ(coord.state(), SyncState::Idle);
  EXPECT_FALSE(coord.editing_source().has_value());
  ASSERT_EQ(states.size(), 2U);
  EXPECT_EQ(states[0], SyncState::Reconciling);
}

TEST_F(SyncCoordinatorTest, FillPastDepthLimitIsRejected)
{
  mathedit::Limits limits;
  limits.max_nesting_depth = 1;
  ManualScheduler local;
  SyncCoordinator shallow(local, Validator(limits, mathedit::CommandPolicy::defaults()));

  ASSERT_TRUE(shallow.load("\\frac{}{}"));
  EXPECT_FALSE(shallow.fill({0}, "\\sqrt{x}"));
  EXPECT_EQ(shallow.markup(), "\\frac{}{}");
  EXPECT_TRUE(shallow.notices().has_kind(ErrorKind::TooDeep));
  EXPECT_FALSE(shallow.can_undo());

  EXPECT_FALSE(shallow.fill({5}, "x"));
  EXPECT_TRUE(shallow.notices().has_kind(ErrorKind::InvalidPath));
}

TEST_F(SyncCoordinatorTest, TemplatesInsertAtFocus)
{
  mathedit::TemplateLibrary lib;
  ASSERT_TRUE(lib.load(mathedit::TemplateLibrary::builtin_templates(), coord.validator()).empty());

  ASSERT_TRUE(coord.insert_template(*lib.find("fraction")));
  EXPECT_EQ(coord.markup(), "\\frac{}{}");
  EXPECT_EQ(coord.focus(), (Path{0}));

  EXPECT_EQ(coord.focus_next(), (Path{1}));
  ASSERT_TRUE(coord.insert_template(*lib.find("sqrt")));
  EXPECT_EQ(coord.markup(), "\\frac{}{\\sqrt{}}");
  EXPECT_EQ(coord.focus(), (Path{1, 0}));

  EXPECT_EQ(coord.focus_previous(), (Path{0}));
  EXPECT_EQ(coord.focus_previous(), (Path{1, 0}));

  ASSERT_TRUE(coord.insert_markup("x"));
  EXPECT_EQ(coord.markup(), "\\frac{}{\\sqrt{x}}");
}

TEST_F(SyncCoordinatorTest, FocusCanBeSetOnAnyNode)
{
  ASSERT_TRUE(coord.load("\\frac{a}{b}"));
  EXPECT_FALSE(coord.focus().has_value());
  EXPECT_FALSE(coord.focus_next().has_value());

  EXPECT_TRUE(coord.set_focus({1}));
  EXPECT_FALSE(coord.set_focus({2}));
  ASSERT_TRUE(coord.insert_markup("1"));
  EXPECT_EQ(coord.markup(), "\\frac{a}{b1}");
}

TEST_F(SyncCoordinatorTest, ApplyFormat)
{
  ASSERT_TRUE(coord.load("a+b"));
  ASSERT_TRUE(coord.apply_format({0}, "mathbf"));
  EXPECT_EQ(coord.markup(), "\\mathbf{a}+b");

  ASSERT_TRUE(coord.apply_format({2}, "textcolor", "blue"));
  EXPECT_EQ(coord.markup(), "\\mathbf{a}+\\textcolor{blue}{b}");

  EXPECT_FALSE(coord.apply_format({0}, "sin"));
  EXPECT_FALSE(coord.apply_format({0}, "textcolor"));
  EXPECT_FALSE(coord.apply_format({0}, "mathbf", "red"));
  EXPECT_TRUE(coord.notices().has_kind(ErrorKind::ArityMismatch));

  EXPECT_FALSE(coord.apply_format({0}, "textcolor", "red}\\input{x"));
  EXPECT_EQ(coord.markup(), "\\mathbf{a}+\\textcolor{blue}{b}");
}

TEST_F(SyncCoordinatorTest, RenderFailureBecomesNotice)
{
  coord.report_render_result(true);
  EXPECT_TRUE(coord.notices().empty());

  coord.report_render_result(false, "unknown symbol");
  ASSERT_EQ(coord.notices().size(), 1U);
  const auto & d = *coord.notices().begin();
  EXPECT_TRUE(d.kind() == ErrorKind::RenderFailure);
  EXPECT_EQ(d.message, "invalid formula");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "unknown symbol");
}

TEST_F(SyncCoordinatorTest, PersistableMarkupIsValidated)
{
  ASSERT_TRUE(coord.load("\\frac{a}{b}"));
  const auto saved = coord.persistable_markup();
  ASSERT_TRUE(saved.has_value());
  EXPECT_EQ(saved.value(), "\\frac{a}{b}");
}

TEST(SyncCoordinatorCompaction, HistorySurvivesArenaMove)
{
  SyncConfig compacting = fast_config();
  compacting.compaction_threshold = 20;

  ManualScheduler s1;
  ManualScheduler s2;
  SyncCoordinator small(s1, Validator{}, compacting);
  SyncCoordinator large(s2, Validator{}, fast_config());

  for (auto * c : {&small, &large}) {
    ASSERT_TRUE(c->load("\\frac{}{}"));
    for (int i = 0; i < 10; ++i) {
      ASSERT_TRUE(c->fill({0}, "a+b+c+" + std::to_string(i)));
    }
  }
  EXPECT_EQ(small.markup(), large.markup());
  EXPECT_LT(small.context().node_count(), large.context().node_count());

  for (int i = 8; i >= 0; --i) {
    ASSERT_TRUE(small.undo());
    EXPECT_EQ(small.markup(), "\\frac{a+b+c+" + std::to_string(i) + "}{}");
  }
  ASSERT_TRUE(small.undo());
  EXPECT_EQ(small.markup(), "\\frac{}{}");
  ASSERT_TRUE(small.redo());
  EXPECT_EQ(small.markup(), "\\frac{a+b+c+0}{}");
}
