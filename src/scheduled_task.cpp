#include "timer_service.hpp"
#include <utility>

constexpr TimerService::TimerId TimerService::kInvalidTimer;

ScheduledTask::ScheduledTask(TimerService &timers, std::function<void()> body)
    : timers_(timers), body_(std::move(body))
{
}

ScheduledTask::~ScheduledTask()
{
  cancel();
}

void ScheduledTask::armAfter(uint32_t delayMs)
{
  cancel();
  timer_ = timers_.schedule(delayMs, [this]() { fire(); });
}

void ScheduledTask::cancel()
{
  if (timer_ == TimerService::kInvalidTimer)
  {
    return;
  }
  timers_.cancel(timer_);
  timer_ = TimerService::kInvalidTimer;
}

void ScheduledTask::fire()
{
  // disarm first so the body may re-arm itself
  timer_ = TimerService::kInvalidTimer;
  if (body_)
  {
    body_();
  }
}
