#pragma once

#include <cstdint>
#include <functional>
#include <utility>
#include "recognition_engine.hpp"
#include "session_log.hpp"
#include "timer_service.hpp"

// Keeps a recognition engine listening for as long as playback wants it,
// restarting it after the engine gives up on silence or stops by itself.
//
//   Inactive --start()--> Active
//   Active --Error(no-speech)--> Inactive + restart armed
//   Active --End, keep-alive--> Inactive + restart armed
//   Active --Error(other)--> Inactive (no restart until the next start())
//   restart fires, still inactive and session open --> start()
class RecognitionCoordinator
{
public:
  using Check = std::function<bool()>;

  RecognitionCoordinator(RecognitionEngine &engine, TimerService &timers, SessionLog &log,
                         SessionLog::Source source, uint32_t restartDelayMs);
  ~RecognitionCoordinator();

  // Gates restarts after the engine ends by itself: true while more of the
  // reply is still expected.
  void setKeepAliveCheck(Check check) { keep_alive_ = std::move(check); }
  // Gates every armed restart: true until the last frame has played.
  void setSessionCheck(Check check) { session_open_ = std::move(check); }
  void setRestartDelay(uint32_t delayMs) { restart_delay_ms_ = delayMs; }

  // No-op when already active. A refused start leaves the coordinator
  // inactive; the next chunk or restart tries again.
  void start();
  void stop();

  // Arms a delayed restart unless the engine is active or one is armed.
  void restart();

  void handleEvent(const RecognitionEvent &event);

  bool isActive() const { return active_; }
  bool isRestartPending() const { return restart_task_.isArmed(); }

private:
  bool keepAlive() const;
  bool sessionOpen() const;
  void onRestartDue();

  RecognitionEngine &engine_;
  SessionLog &log_;
  const SessionLog::Source source_;
  uint32_t restart_delay_ms_;
  Check keep_alive_;
  Check session_open_;
  ScheduledTask restart_task_;

  bool active_ = false;
  bool hard_failed_ = false;
};
