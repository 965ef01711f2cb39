#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include "audio_output.hpp"
#include "completion_tracker.hpp"
#include "pcm_ingestor.hpp"
#include "playback_scheduler.hpp"
#include "processing_registry.hpp"
#include "protocols.hpp"
#include "recognition_coordinator.hpp"
#include "recognition_engine.hpp"
#include "session_log.hpp"
#include "state_machine.hpp"
#include "stream_config.hpp"
#include "timer_service.hpp"

// One streaming reply session: PCM16LE chunks in, gapless playback out,
// recognition narrating the reply while it plays.
class Speaker
{
public:
  Speaker(StateMachine &sm, AudioOutput &output, TimerService &timers, RecognitionEngine &engine,
          ProcessingRegistry &registry, SessionLog &log, const StreamConfig &config = StreamConfig());

  // Registers the state entry events; call once from setup
  void init();

  // Process one WS audio message of kind AudioReply
  void handleAudioMessage(const WsHeader &hdr, const uint8_t *body, size_t bodyLen);

  // raw little-endian PCM16, any length
  void ingest(const uint8_t *data, size_t len);

  // No more data will arrive; flushes the partial frame.
  void complete();

  // Drops queued audio and fades out. Safe in every state.
  void stop();

  // Readies the output for a new session; false if the device stays suspended.
  bool resume();

  // Fired once per completed or stopped session.
  void setOnComplete(std::function<void()> cb) { on_complete_ = std::move(cb); }

  // Loads (or reuses) a named processing stage and routes playback through it.
  // false if the stage could not be loaded.
  bool addProcessor(const std::string &name, const ProcessingRegistry::Loader &load,
                    ProcessingStage::Handler handler);

  bool isPlaying() const { return state_.isActive(); }
  bool isStreamComplete() const { return tracker_.isStreamComplete(); }
  size_t queuedFrames() const { return scheduler_.queuedFrames(); }
  size_t pendingSamples() const { return ingestor_.pendingSamples(); }
  double scheduledTime() const { return scheduler_.scheduledTime(); }
  uint32_t sampleRate() const { return scheduler_.sampleRate(); }
  const RecognitionCoordinator &recognition() const { return recognition_; }

private:
  void beginSession();
  void finishSession();

  StateMachine &state_;
  AudioOutput &output_;
  ProcessingRegistry &registry_;
  SessionLog &log_;
  const StreamConfig config_;

  PcmIngestor ingestor_;
  CompletionTracker tracker_;
  PlaybackScheduler scheduler_;
  RecognitionCoordinator recognition_;

  std::function<void()> on_complete_;
  bool events_registered_ = false;
  bool streaming_ = false;
  uint16_t next_seq_ = 0;
};
