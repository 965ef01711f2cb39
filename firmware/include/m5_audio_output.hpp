#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>
#include <M5Unified.h>
#include "audio_output.hpp"
#include "channel_queue.hpp"

class M5AudioOutput;

// Channel volume with a linear ramp, sampled by the output on every loop.
class M5GainStage : public GainStage
{
public:
  explicit M5GainStage(const M5AudioOutput &output) : output_(output) {}

  void setValueAtTime(float value, double when) override;
  void linearRampToValueAtTime(float value, double endTime) override;
  void disconnect() override { connected_ = false; }

  // effective gain at `now` (0 once disconnected)
  float valueAt(double now) const;

private:
  const M5AudioOutput &output_;
  float from_ = 1.0f;
  float to_ = 1.0f;
  double ramp_start_ = 0.0;
  double ramp_end_ = 0.0;
  bool connected_ = true;
};

class M5SourceNode : public SourceNode, public std::enable_shared_from_this<M5SourceNode>
{
public:
  M5SourceNode(M5AudioOutput &owner, const std::vector<float> &samples, uint32_t sampleRate);

  void connect(const std::shared_ptr<GainStage> &gain) override { gain_ = gain; }
  void connect(const std::shared_ptr<ProcessingStage> &stage) override { stage_ = stage; }
  void setOnEnded(EndedCallback cb) override { on_ended_ = std::move(cb); }
  void start(double when) override;
  double duration() const override;

private:
  friend class M5AudioOutput;

  M5AudioOutput &owner_;
  std::vector<float> samples_;
  // playRaw reads from this buffer until the channel is done with it
  std::vector<int16_t> pcm_;
  uint32_t sample_rate_;
  double start_time_ = 0.0;
  std::shared_ptr<GainStage> gain_;
  std::shared_ptr<ProcessingStage> stage_;
  EndedCallback on_ended_;
};

// AudioOutput on one M5Unified speaker channel. Scheduled sources wait until
// their start time is close and the channel queue has room, then go to
// playRaw; the channel holds two buffers so consecutive frames play back to
// back. A refused playRaw is retried on the next loop().
class M5AudioOutput : public AudioOutput
{
public:
  explicit M5AudioOutput(uint8_t channel = 0);

  void init();

  // Submits due sources, reports finished ones and applies the gain.
  void loop();

  double currentTime() const override;
  bool isSuspended() const override;
  bool resume() override;

  std::shared_ptr<SourceNode> createSource(const std::vector<float> &samples, uint32_t sampleRate) override;
  std::shared_ptr<GainStage> createGain() override;

private:
  friend class M5SourceNode;

  static constexpr size_t kChannelDepth = 2;
  // sources handed over but not yet finished
  static constexpr size_t kMaxInFlight = 4;
  // submit this far ahead of the start time
  static constexpr double kSubmitLead = 0.03;

  void enqueue(const std::shared_ptr<M5SourceNode> &node, double when);
  bool submit(const std::shared_ptr<M5SourceNode> &node, double now);
  void reapFinished();
  void applyGain(double now);

  const uint8_t channel_;
  int64_t origin_us_ = 0;
  ChannelQueue<M5SourceNode> queue_;
  uint8_t last_volume_ = 0;
  // set while the head source is being refused, so the warning is logged once
  bool refusing_ = false;
};
