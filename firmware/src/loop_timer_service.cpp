#include "loop_timer_service.hpp"
#include <Arduino.h>
#include <algorithm>
#include <utility>

TimerService::TimerId LoopTimerService::schedule(uint32_t delayMs, Callback cb)
{
  TimerId id = next_id_++;
  if (next_id_ == kInvalidTimer)
  {
    next_id_ = 1;
  }
  timers_.push_back(Entry{id, millis() + delayMs, std::move(cb)});
  return id;
}

void LoopTimerService::cancel(TimerId id)
{
  timers_.erase(std::remove_if(timers_.begin(), timers_.end(), [id](const Entry &e) { return e.id == id; }),
                timers_.end());
}

void LoopTimerService::loop()
{
  const uint32_t now = millis();

  std::vector<TimerId> due;
  for (const auto &e : timers_)
  {
    // wrap-safe comparison
    if (static_cast<int32_t>(now - e.due_ms) >= 0)
    {
      due.push_back(e.id);
    }
  }

  for (TimerId id : due)
  {
    auto it = std::find_if(timers_.begin(), timers_.end(), [id](const Entry &e) { return e.id == id; });
    if (it == timers_.end())
    {
      // cancelled by an earlier callback
      continue;
    }
    Callback cb = std::move(it->cb);
    timers_.erase(it);
    if (cb)
    {
      cb();
    }
  }
}
