#pragma once

#include <M5Unified.h>
#include <string>
#include "session_log.hpp"
#include "state_machine.hpp"

// Face and log console. Also the SessionLog of the playback core: log lines go
// to log_x, transcripts to log_i and the screen.
class Display : public SessionLog
{
public:
  explicit Display(StateMachine &stateMachine);

  void init();
  void loop();

  // reply loudness from the level meter, 0..1
  void setVolume(float volume) { volume_ = volume; }

  void transcript(Source source, const std::string &text) override;
  void write(Level level, const char *message) override;

private:
  void drawForState(StateMachine::State state);
  void drawMouth();
  static uint16_t colorForState(StateMachine::State state);

  StateMachine &state_;
  bool has_prev_state_ = false;
  StateMachine::State prev_state_ = StateMachine::Idle;
  float volume_ = 0.0f;
  int32_t mouth_height_ = -1;
};
