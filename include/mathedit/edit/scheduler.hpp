// mathedit/edit/scheduler.hpp - Cancellable one-shot timers
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace mathedit
{

using Millis = std::chrono::milliseconds;

/// 0 is never a live timer
using TimerId = uint64_t;
inline constexpr TimerId k_no_timer = 0;

/**
 * Source of one-shot timers for the debounce logic.
 *
 * The host implements this over its event loop. Callbacks run on the
 * host's thread; a cancelled timer never fires.
 */
class Scheduler
{
public:
  virtual ~Scheduler() = default;

  Scheduler() = default;
  Scheduler(const Scheduler &) = delete;
  Scheduler & operator=(const Scheduler &) = delete;

  virtual TimerId schedule(Millis delay, std::function<void()> fn) = 0;

  /// False if the timer already fired or was cancelled
  virtual bool cancel(TimerId id) = 0;

  /// Monotonic time since an arbitrary epoch
  [[nodiscard]] virtual Millis now() const = 0;
};

/**
 * Scheduler driven by explicit calls to advance().
 *
 * Timers due at the same instant fire in scheduling order. A callback may
 * schedule or cancel other timers; new timers that become due within the
 * advanced interval fire in the same call.
 */
class ManualScheduler final : public Scheduler
{
public:
  TimerId schedule(Millis delay, std::function<void()> fn) override;
  bool cancel(TimerId id) override;
  [[nodiscard]] Millis now() const override { return now_; }

  void advance(Millis delta) { advance_to(now_ + delta); }

  /// Fire every timer due at or before `t`, then set the clock to `t`
  void advance_to(Millis t);

  [[nodiscard]] size_t pending_count() const noexcept { return timers_.size(); }

private:
  // Ordered by (due time, id)
  using Key = std::pair<Millis, TimerId>;

  Millis now_{0};
  TimerId next_id_ = 1;
  std::map<Key, std::function<void()>> timers_;
};

}  // namespace mathedit
