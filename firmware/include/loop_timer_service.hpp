#pragma once

#include <cstdint>
#include <vector>
#include "timer_service.hpp"

// Timers driven from the Arduino loop by millis().
class LoopTimerService : public TimerService
{
public:
  TimerId schedule(uint32_t delayMs, Callback cb) override;
  void cancel(TimerId id) override;

  // Runs the timers whose deadline has passed; call every loop()
  void loop();

private:
  struct Entry
  {
    TimerId id;
    uint32_t due_ms;
    Callback cb;
  };

  std::vector<Entry> timers_;
  TimerId next_id_ = 1;
};
