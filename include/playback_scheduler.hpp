#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <utility>
#include "audio_output.hpp"
#include "completion_tracker.hpp"
#include "pcm_ingestor.hpp"
#include "processing_stage.hpp"
#include "session_log.hpp"
#include "stream_config.hpp"
#include "timer_service.hpp"

// Feeds queued frames to the output clock back to back, never more than
// schedule_ahead_time ahead of it. Progress is driven by a self re-arming
// task; a pass always leaves it armed while work remains.
class PlaybackScheduler
{
public:
  PlaybackScheduler(AudioOutput &output, TimerService &timers, const PcmIngestor &ingestor,
                    CompletionTracker &tracker, SessionLog &log, const StreamConfig &config);

  // frames are appended here by the ingestor
  std::deque<PlaybackFrame> &queue() { return queue_; }

  // Starts a session: first frame due after the warm-up delay.
  void begin();

  // Runs a pass now unless one is already armed.
  void kick();

  void scheduleNextBuffer();

  // Drops every queued frame and fades the output out. Sources already
  // handed to the output finish on their own.
  void stop();

  // Moves the next start to now + warm-up. While playing the time only moves
  // forward so already queued sources are never overlapped.
  void resetClock(bool playing);
  void restoreGain();

  void setProcessor(std::shared_ptr<ProcessingStage> stage) { processor_ = std::move(stage); }
  void setSampleRate(uint32_t sampleRate);

  size_t queuedFrames() const { return queue_.size(); }
  double scheduledTime() const { return scheduled_time_; }
  uint32_t sampleRate() const { return sample_rate_; }
  bool isPassArmed() const { return pass_task_.isArmed(); }
  bool isGainSwapPending() const { return gain_swap_task_.isArmed(); }

private:
  void swapGain();

  AudioOutput &output_;
  const PcmIngestor &ingestor_;
  CompletionTracker &tracker_;
  SessionLog &log_;
  const StreamConfig &config_;

  std::deque<PlaybackFrame> queue_;
  std::shared_ptr<GainStage> gain_;
  std::shared_ptr<ProcessingStage> processor_;
  uint32_t sample_rate_;
  double scheduled_time_ = 0.0;

  ScheduledTask pass_task_;
  ScheduledTask gain_swap_task_;
};
