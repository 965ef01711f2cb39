#pragma once

#include <cstdint>
#include <vector>
#include "fake_recognition_engine.hpp"
#include "processing_registry.hpp"
#include "recording_session_log.hpp"
#include "sim_loop.hpp"
#include "speaker.hpp"
#include "state_machine.hpp"
#include "stream_config.hpp"

namespace mocks
{

// Speaker wired to the simulated loop, counting completion callbacks.
struct SpeakerRig
{
  explicit SpeakerRig(const StreamConfig &config = StreamConfig())
      : speaker(state, loop.output, loop.timers, engine, registry, log, config)
  {
    speaker.init();
    speaker.setOnComplete([this]() { completions++; });
  }

  SimLoop loop;
  FakeRecognitionEngine engine;
  RecordingSessionLog log;
  ProcessingRegistry registry;
  StateMachine state;
  Speaker speaker;
  int completions = 0;
};

// PCM16LE bytes for `count` samples counting up from `first`.
inline std::vector<uint8_t> pcmRamp(size_t count, int16_t first = 0)
{
  std::vector<uint8_t> bytes;
  bytes.reserve(count * 2);
  int16_t value = first;
  for (size_t i = 0; i < count; ++i)
  {
    const uint16_t raw = static_cast<uint16_t>(value);
    bytes.push_back(static_cast<uint8_t>(raw & 0xFF));
    bytes.push_back(static_cast<uint8_t>(raw >> 8));
    value = static_cast<int16_t>(value + 1);
  }
  return bytes;
}

} // namespace mocks
