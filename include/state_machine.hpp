#pragma once

#include <array>
#include <functional>
#include <stdint.h>
#include <vector>

// Playback session state.
//  Idle -> Playing      first ingested chunk
//  Playing -> Draining  complete() while frames remain
//  Draining -> Stopped  last scheduled frame finished
//  any -> Stopped       stop()
class StateMachine
{
public:
  enum State : uint8_t
  {
    Idle = 0,
    Playing = 1,
    Draining = 2,
    Stopped = 3,
  };

  StateMachine() = default;

  void setState(State s);
  State getState() const;
  bool isIdle() const;
  bool isPlaying() const;
  bool isDraining() const;
  bool isStopped() const;

  // Playing or Draining
  bool isActive() const;

  static const char *stateToString(State s);

  using Callback = std::function<void(State prev, State next)>;
  void addStateEntryEvent(State state, Callback cb);
  void addStateExitEvent(State state, Callback cb);

private:
  State state_ = Idle;
  std::array<std::vector<Callback>, 4> entry_events_{};
  std::array<std::vector<Callback>, 4> exit_events_{};
};
