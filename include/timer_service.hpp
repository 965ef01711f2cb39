#pragma once

#include <cstdint>
#include <functional>

// One-shot timers on the main loop's execution context.
class TimerService
{
public:
  using TimerId = uint32_t;
  using Callback = std::function<void()>;

  static constexpr TimerId kInvalidTimer = 0;

  virtual ~TimerService() = default;

  // run cb once, no earlier than delayMs from now
  virtual TimerId schedule(uint32_t delayMs, Callback cb) = 0;
  virtual void cancel(TimerId id) = 0;
};

// A continuation that is either idle or armed with a single deadline.
// Re-arming replaces the previous deadline; it never stacks.
class ScheduledTask
{
public:
  ScheduledTask(TimerService &timers, std::function<void()> body);
  ~ScheduledTask();

  ScheduledTask(const ScheduledTask &) = delete;
  ScheduledTask &operator=(const ScheduledTask &) = delete;

  void armAfter(uint32_t delayMs);
  void cancel();
  bool isArmed() const { return timer_ != TimerService::kInvalidTimer; }

private:
  void fire();

  TimerService &timers_;
  std::function<void()> body_;
  TimerService::TimerId timer_ = TimerService::kInvalidTimer;
};
