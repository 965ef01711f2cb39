#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>
#include "processing_stage.hpp"

// Output-side gain. A stage is connected to the destination when created and
// is never reconnected after disconnect(); callers replace it instead.
class GainStage
{
public:
  virtual ~GainStage() = default;

  virtual void setValueAtTime(float value, double when) = 0;
  virtual void linearRampToValueAtTime(float value, double endTime) = 0;
  virtual void disconnect() = 0;
};

// One-shot playback handle bound to a single frame.
class SourceNode
{
public:
  using EndedCallback = std::function<void()>;

  virtual ~SourceNode() = default;

  virtual void connect(const std::shared_ptr<GainStage> &gain) = 0;
  virtual void connect(const std::shared_ptr<ProcessingStage> &stage) = 0;

  // An empty callback disarms the notification.
  virtual void setOnEnded(EndedCallback cb) = 0;

  // Starts playback at `when` on the output clock. The output keeps the node
  // alive until it has finished and the end notification has run.
  virtual void start(double when) = 0;

  virtual double duration() const = 0;
};

// The audio device as seen by the scheduler: a clock, a source factory and a
// gain factory.
class AudioOutput
{
public:
  virtual ~AudioOutput() = default;

  // seconds, monotonic
  virtual double currentTime() const = 0;

  virtual bool isSuspended() const = 0;
  // Blocks until the device runs again; false if it could not be resumed.
  virtual bool resume() = 0;

  // nullptr if the device cannot take another buffer right now
  virtual std::shared_ptr<SourceNode> createSource(const std::vector<float> &samples, uint32_t sampleRate) = 0;
  virtual std::shared_ptr<GainStage> createGain() = 0;
};
