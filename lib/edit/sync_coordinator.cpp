// mathedit/edit/sync_coordinator.cpp - Keeps the tree, markup and preview in step
#include "mathedit/edit/sync_coordinator.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "mathedit/syntax/commands.hpp"
#include "mathedit/syntax/frontend.hpp"
#include "mathedit/syntax/serializer.hpp"

namespace mathedit
{

SyncCoordinator::SyncCoordinator(Scheduler & scheduler, Validator validator, SyncConfig config)
: scheduler_(scheduler),
  validator_(std::move(validator)),
  config_(config),
  ctx_(std::make_unique<ExprContext>()),
  history_(config.history_depth),
  placeholders_(validator_)
{
  root_ = ctx_->create<PlaceholderExpr>();
  placeholders_.reset(root_);
  focus_ = placeholders_.next(std::nullopt);
}

SyncCoordinator::~SyncCoordinator()
{
  cancel_timer(reparse_timer_);
  cancel_timer(refresh_timer_);
}

// ============================================================================
// Edit pipeline
// ============================================================================

bool SyncCoordinator::submit(EditSource source, std::function<bool()> edit)
{
  if (state_ != SyncState::Idle) {
    queue_.push_back(PendingEdit{source, std::move(edit)});
    return true;
  }

  const bool applied = run(source, edit);
  while (!queue_.empty()) {
    PendingEdit next = std::move(queue_.front());
    queue_.pop_front();
    run(next.source, next.apply);
  }
  compact_if_needed();
  return applied;
}

bool SyncCoordinator::run(EditSource source, const std::function<bool()> & edit)
{
  state_ = SyncState::Editing;
  editing_source_ = source;
  const bool applied = edit();
  editing_source_.reset();
  state_ = SyncState::Idle;
  return applied;
}

const Expr * SyncCoordinator::build(std::string_view markup)
{
  auto checked = validator_.validate(markup);
  if (!checked) {
    for (const auto & error : checked.error()) {
      post(error);
    }
    return nullptr;
  }

  ParseOutput parsed = parse_markup(*ctx_, *checked);
  if (!parsed.ok()) {
    for (const auto & d : parsed.diagnostics.errors()) {
      post(d);
    }
    return nullptr;
  }
  return parsed.root;
}

bool SyncCoordinator::apply_result(const EditResult & result, const Path & edited)
{
  if (!result) {
    for (const auto & error : result.error()) {
      post(error);
    }
    return false;
  }
  commit(*result, EditSource::Structural, edited, true);
  return true;
}

void SyncCoordinator::commit(
  const Expr * new_root, EditSource source, const Path & edited, bool record)
{
  state_ = SyncState::Reconciling;

  if (record) {
    history_.push(root_);
  }
  root_ = new_root;
  last_commit_ = CommitInfo{source, scheduler_.now()};

  // Focus the first placeholder at or after the edit
  placeholders_.reset(root_);
  const auto & slots = placeholders_.placeholders();
  auto it = std::find_if(slots.begin(), slots.end(), [&](const Path & p) { return p >= edited; });
  focus_ = it != slots.end() ? std::optional<Path>(*it) : placeholders_.next(std::nullopt);

  if (source == EditSource::Structural) {
    schedule_refresh();
  } else {
    cancel_timer(refresh_timer_);
  }

  if (callbacks_.on_tree) {
    callbacks_.on_tree(root_);
  }
  if (callbacks_.on_render) {
    callbacks_.on_render(serialize(root_));
  }
}

// ============================================================================
// Structural edits
// ============================================================================

bool SyncCoordinator::load(std::string_view markup)
{
  std::string text(markup);
  return submit(EditSource::Textual, [this, text = std::move(text)]() {
    const Expr * tree = build(text);
    if (tree == nullptr) {
      return false;
    }
    cancel_timer(reparse_timer_);
    text_view_ = text;
    commit(tree, EditSource::Textual, {}, false);
    history_.clear();
    return true;
  });
}

bool SyncCoordinator::insert_markup(std::string_view markup)
{
  std::string text(markup);
  return submit(EditSource::Structural, [this, text = std::move(text)]() {
    const Expr * tree = build(text);
    if (tree == nullptr) {
      return false;
    }
    const Path target = focus_.value_or(Path{});
    return apply_result(placeholders_.insert(*ctx_, root_, target, tree), target);
  });
}

bool SyncCoordinator::insert_template(const ToolbarTemplate & tpl)
{
  const Expr * tree = tpl.tree;
  return submit(EditSource::Structural, [this, tree]() {
    const Path target = focus_.value_or(Path{});
    return apply_result(placeholders_.insert(*ctx_, root_, target, tree), target);
  });
}

bool SyncCoordinator::fill(const Path & path, std::string_view markup)
{
  std::string text(markup);
  return submit(EditSource::Structural, [this, path, text = std::move(text)]() {
    const Expr * tree = build(text);
    if (tree == nullptr) {
      return false;
    }
    return apply_result(placeholders_.fill(*ctx_, root_, path, tree), path);
  });
}

bool SyncCoordinator::apply_format(
  const Path & path, std::string_view command, std::optional<std::string_view> attribute)
{
  std::string cmd(command);
  std::optional<std::string> attr;
  if (attribute) {
    attr = std::string(*attribute);
  }

  return submit(EditSource::Structural, [this, path, cmd = std::move(cmd), attr]() {
    const auto cls = syntax::classify_command(cmd);
    const bool colored = cls == syntax::CommandClass::ColoredFormat;
    if (cls != syntax::CommandClass::Format && !colored) {
      post(ValidationError{
        ErrorKind::ArityMismatch, fmt::format("'\\{}' is not a format command", cmd),
        SourceRange{}, cmd});
      return false;
    }
    if (colored != attr.has_value()) {
      post(ValidationError{
        ErrorKind::ArityMismatch,
        fmt::format("'\\{}' takes {} attribute", cmd, colored ? "an" : "no"), SourceRange{}, cmd});
      return false;
    }
    if (!validator_.policy().is_allowed(cmd) || validator_.policy().is_denied(cmd)) {
      post(ValidationError{
        ErrorKind::DisallowedCommand, fmt::format("command '\\{}' is not allowed", cmd),
        SourceRange{}, cmd});
      return false;
    }

    std::optional<std::string_view> stored_attr;
    if (attr) {
      stored_attr = ctx_->intern(*attr);
    }
    const Expr * wrapper = ctx_->create<FormatWrapperExpr>(
      ctx_->intern(cmd), stored_attr, ctx_->list({ctx_->create<PlaceholderExpr>()}));
    EditResult result = placeholders_.wrap(*ctx_, root_, path, wrapper);

    // The attribute is raw text; check the markup it produces
    if (result) {
      const auto errors = validator_.inspect(serialize(*result));
      if (!errors.empty()) {
        for (const auto & error : errors) {
          post(error);
        }
        return false;
      }
    }
    return apply_result(result, path);
  });
}

bool SyncCoordinator::undo()
{
  return submit(EditSource::Structural, [this]() {
    const Expr * previous = history_.undo(root_);
    if (previous == nullptr) {
      return false;
    }
    commit(previous, EditSource::Structural, {}, false);
    return true;
  });
}

bool SyncCoordinator::redo()
{
  return submit(EditSource::Structural, [this]() {
    const Expr * next = history_.redo(root_);
    if (next == nullptr) {
      return false;
    }
    commit(next, EditSource::Structural, {}, false);
    return true;
  });
}

// ============================================================================
// Textual edits
// ============================================================================

void SyncCoordinator::text_changed(std::string markup)
{
  text_view_ = markup;
  pending_text_ = std::move(markup);
  // A refresh would overwrite the newer text with the tree it was scheduled for
  cancel_timer(refresh_timer_);
  cancel_timer(reparse_timer_);
  reparse_timer_ = scheduler_.schedule(Millis{config_.textual_debounce_ms}, [this]() {
    reparse_timer_ = k_no_timer;
    submit(EditSource::Textual, [this]() { return reparse(); });
  });
}

bool SyncCoordinator::reparse()
{
  const Expr * tree = build(pending_text_);
  if (tree == nullptr) {
    return false;
  }
  commit(tree, EditSource::Textual, {}, true);

  // A refresh that fired after the keystrokes showed older markup
  if (text_view_ != pending_text_) {
    text_view_ = pending_text_;
    if (callbacks_.on_markup) {
      callbacks_.on_markup(text_view_);
    }
  }
  return true;
}

// ============================================================================
// Timers
// ============================================================================

void SyncCoordinator::schedule_refresh()
{
  cancel_timer(refresh_timer_);
  refresh_timer_ = scheduler_.schedule(Millis{config_.structural_debounce_ms}, [this]() {
    refresh_timer_ = k_no_timer;
    text_view_ = serialize(root_);
    if (callbacks_.on_markup) {
      callbacks_.on_markup(text_view_);
    }
  });
}

void SyncCoordinator::cancel_timer(TimerId & id)
{
  if (id != k_no_timer) {
    scheduler_.cancel(id);
    id = k_no_timer;
  }
}

// ============================================================================
// Focus, rendering, queries
// ============================================================================

std::optional<Path> SyncCoordinator::focus_next()
{
  if (auto p = placeholders_.next(focus_)) {
    focus_ = std::move(p);
  }
  return focus_;
}

std::optional<Path> SyncCoordinator::focus_previous()
{
  if (auto p = placeholders_.previous(focus_)) {
    focus_ = std::move(p);
  }
  return focus_;
}

bool SyncCoordinator::set_focus(const Path & path)
{
  if (node_at(root_, path) == nullptr) {
    return false;
  }
  focus_ = path;
  return true;
}

void SyncCoordinator::report_render_result(bool ok, std::string_view detail)
{
  if (ok) {
    return;
  }
  Diagnostic d;
  d.code = std::string(error_code(ErrorKind::RenderFailure));
  d.message = "invalid formula";
  if (!detail.empty()) {
    d.help_message = std::string(detail);
  }
  post(std::move(d));
}

std::string SyncCoordinator::markup() const { return serialize(root_); }

ValidationResult SyncCoordinator::persistable_markup() const
{
  return validator_.validate(serialize(root_));
}

// ============================================================================
// Arena compaction
// ============================================================================

void SyncCoordinator::compact_if_needed()
{
  if (ctx_->node_count() <= config_.compaction_threshold) {
    return;
  }

  auto fresh = std::make_unique<ExprContext>();
  CloneMemo memo;
  root_ = clone_into(*fresh, root_, memo);
  for (const Expr * old_root : history_.roots()) {
    (void)clone_into(*fresh, old_root, memo);
  }
  history_.remap(memo);
  ctx_ = std::move(fresh);

  if (callbacks_.on_tree) {
    callbacks_.on_tree(root_);
  }
}

// ============================================================================
// Notices
// ============================================================================

void SyncCoordinator::post(Diagnostic notice)
{
  notices_.add(notice);
  if (callbacks_.on_notice) {
    callbacks_.on_notice(notice);
  }
}

void SyncCoordinator::post(const ValidationError & error) { post(to_diagnostic(error)); }

}  // namespace mathedit
