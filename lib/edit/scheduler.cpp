// mathedit/edit/scheduler.cpp - Deterministic scheduler
#include "mathedit/edit/scheduler.hpp"

#include <algorithm>

namespace mathedit
{

TimerId ManualScheduler::schedule(Millis delay, std::function<void()> fn)
{
  const TimerId id = next_id_++;
  timers_.emplace(Key{now_ + std::max(delay, Millis{0}), id}, std::move(fn));
  return id;
}

bool ManualScheduler::cancel(TimerId id)
{
  for (auto it = timers_.begin(); it != timers_.end(); ++it) {
    if (it->first.second == id) {
      timers_.erase(it);
      return true;
    }
  }
  return false;
}

void ManualScheduler::advance_to(Millis t)
{
  while (!timers_.empty() && timers_.begin()->first.first <= t) {
    auto it = timers_.begin();
    now_ = std::max(now_, it->first.first);
    std::function<void()> fn = std::move(it->second);
    timers_.erase(it);
    fn();
  }
  now_ = std::max(now_, t);
}

}  // namespace mathedit
