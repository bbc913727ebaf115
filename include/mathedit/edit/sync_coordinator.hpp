// mathedit/edit/sync_coordinator.hpp - Keeps the tree, markup and preview in step
#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "mathedit/basic/diagnostic.hpp"
#include "mathedit/config/engine_config.hpp"
#include "mathedit/edit/history.hpp"
#include "mathedit/edit/placeholder_manager.hpp"
#include "mathedit/edit/scheduler.hpp"
#include "mathedit/edit/template_library.hpp"
#include "mathedit/tree/expr.hpp"
#include "mathedit/tree/expr_context.hpp"
#include "mathedit/tree/tree_ops.hpp"
#include "mathedit/validate/validator.hpp"

namespace mathedit
{

enum class EditSource : uint8_t {
  Structural,  // toolbar, placeholder fill, format, undo/redo
  Textual,     // markup typed into the text view
};

enum class SyncState : uint8_t {
  Idle,
  Editing,
  Reconciling,
};

[[nodiscard]] constexpr std::string_view to_string(EditSource s) noexcept
{
  return s == EditSource::Structural ? "structural" : "textual";
}

[[nodiscard]] constexpr std::string_view to_string(SyncState s) noexcept
{
  switch (s) {
    case SyncState::Idle:
      return "idle";
    case SyncState::Editing:
      return "editing";
    case SyncState::Reconciling:
      return "reconciling";
  }
  return "<unknown>";
}

/// Source and completion time of the edit that produced the current root
struct CommitInfo
{
  EditSource source = EditSource::Structural;
  Millis at{0};
};

/// Host hooks; any of them may be empty
struct SyncCallbacks
{
  /// Debounced refresh of the text view after structural edits
  std::function<void(std::string_view markup)> on_markup;
  /// New canonical root for the structural view (valid until the next commit)
  std::function<void(const Expr * root)> on_tree;
  /// Markup to hand to the renderer after every commit
  std::function<void(std::string_view markup)> on_render;
  std::function<void(const Diagnostic & notice)> on_notice;
};

/**
 * Exclusive owner of the canonical tree.
 *
 * Structural edits apply immediately; the text view is refreshed after
 * `structural_debounce_ms`. Text changes are reparsed once input has been
 * quiet for `textual_debounce_ms`. Whichever completes later wins. A text
 * change cancels a pending text-view refresh, and a textual commit leaves
 * the text view showing the committed text.
 *
 * Edits submitted from a callback while another edit is in flight are
 * queued and applied in order afterwards. Rejected edits post a notice and
 * leave the tree untouched.
 *
 * Every public edit returns false only when it was rejected immediately;
 * a queued edit returns true and reports problems through notices.
 */
class SyncCoordinator
{
public:
  SyncCoordinator(Scheduler & scheduler, Validator validator, SyncConfig config = {});
  ~SyncCoordinator();

  SyncCoordinator(const SyncCoordinator &) = delete;
  SyncCoordinator & operator=(const SyncCoordinator &) = delete;
  SyncCoordinator(SyncCoordinator &&) = delete;
  SyncCoordinator & operator=(SyncCoordinator &&) = delete;

  void set_callbacks(SyncCallbacks callbacks) { callbacks_ = std::move(callbacks); }

  /// Replace the formula with `markup` (initial value). Commits at once as a
  /// textual edit, drops any pending reparse and clears history.
  bool load(std::string_view markup);

  // ===========================================================================
  // Structural edits
  // ===========================================================================

  /// Insert markup at the focused placeholder, or at the root
  bool insert_markup(std::string_view markup);
  bool insert_template(const ToolbarTemplate & tpl);

  /// Replace the node at `path` with the tree of `markup`
  bool fill(const Path & path, std::string_view markup);

  /// Wrap the node at `path` in a format command such as mathbf or textcolor
  bool apply_format(
    const Path & path, std::string_view command,
    std::optional<std::string_view> attribute = std::nullopt);

  bool undo();
  bool redo();

  // ===========================================================================
  // Textual edits
  // ===========================================================================

  /// Store the text view content and (re)start the reparse timer
  void text_changed(std::string markup);

  [[nodiscard]] bool reparse_pending() const noexcept { return reparse_timer_ != k_no_timer; }
  [[nodiscard]] bool refresh_pending() const noexcept { return refresh_timer_ != k_no_timer; }

  // ===========================================================================
  // Focus and rendering
  // ===========================================================================

  std::optional<Path> focus_next();
  std::optional<Path> focus_previous();
  bool set_focus(const Path & path);
  [[nodiscard]] const std::optional<Path> & focus() const noexcept { return focus_; }
  [[nodiscard]] const std::vector<Path> & placeholders() const noexcept
  {
    return placeholders_.placeholders();
  }

  /// Renderer feedback; a failure posts a RenderFailure notice
  void report_render_result(bool ok, std::string_view detail = {});

  // ===========================================================================
  // Queries
  // ===========================================================================

  [[nodiscard]] const Expr * root() const noexcept { return root_; }

  /// Canonical markup of the current root
  [[nodiscard]] std::string markup() const;

  /// What the text view currently shows
  [[nodiscard]] const std::string & text_view() const noexcept { return text_view_; }

  /// Only validator-approved markup leaves the editor
  [[nodiscard]] ValidationResult persistable_markup() const;

  [[nodiscard]] const DiagnosticBag & notices() const noexcept { return notices_; }
  void clear_notices() { notices_ = DiagnosticBag{}; }

  [[nodiscard]] SyncState state() const noexcept { return state_; }
  /// Source of the edit in flight, if any
  [[nodiscard]] std::optional<EditSource> editing_source() const noexcept
  {
    return editing_source_;
  }
  [[nodiscard]] const std::optional<CommitInfo> & last_commit() const noexcept
  {
    return last_commit_;
  }
  [[nodiscard]] bool can_undo() const noexcept { return history_.can_undo(); }
  [[nodiscard]] bool can_redo() const noexcept { return history_.can_redo(); }
  [[nodiscard]] const ExprContext & context() const noexcept { return *ctx_; }
  [[nodiscard]] const Validator & validator() const noexcept { return validator_; }

private:
  struct PendingEdit
  {
    EditSource source;
    std::function<bool()> apply;
  };

  bool submit(EditSource source, std::function<bool()> edit);
  bool run(EditSource source, const std::function<bool()> & edit);

  /// Validate and parse markup into the arena; posts notices on failure
  [[nodiscard]] const Expr * build(std::string_view markup);

  bool apply_result(const EditResult & result, const Path & edited);
  void commit(const Expr * new_root, EditSource source, const Path & edited, bool record);
  bool reparse();

  void schedule_refresh();
  void cancel_timer(TimerId & id);
  void compact_if_needed();

  void post(Diagnostic notice);
  void post(const ValidationError & error);

  Scheduler & scheduler_;
  Validator validator_;
  SyncConfig config_;
  SyncCallbacks callbacks_;

  std::unique_ptr<ExprContext> ctx_;
  const Expr * root_ = nullptr;
  History history_;
  PlaceholderManager placeholders_;
  std::optional<Path> focus_;

  std::string text_view_;
  std::string pending_text_;
  TimerId reparse_timer_ = k_no_timer;
  TimerId refresh_timer_ = k_no_timer;

  SyncState state_ = SyncState::Idle;
  std::optional<EditSource> editing_source_;
  std::deque<PendingEdit> queue_;
  std::optional<CommitInfo> last_commit_;
  DiagnosticBag notices_;
};

}  // namespace mathedit
