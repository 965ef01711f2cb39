#include "m5_audio_output.hpp"
#include <algorithm>
#include <esp_timer.h>

namespace
{
int16_t toPcm16(float v)
{
  v = std::min(1.0f, std::max(-1.0f, v));
  return static_cast<int16_t>(v * 32767.0f);
}
} // namespace

void M5GainStage::setValueAtTime(float value, double when)
{
  from_ = to_ = value;
  ramp_start_ = ramp_end_ = when;
}

void M5GainStage::linearRampToValueAtTime(float value, double endTime)
{
  const double now = output_.currentTime();
  from_ = valueAt(now);
  to_ = value;
  ramp_start_ = now;
  ramp_end_ = endTime;
}

float M5GainStage::valueAt(double now) const
{
  if (!connected_)
  {
    return 0.0f;
  }
  if (now >= ramp_end_ || ramp_end_ <= ramp_start_)
  {
    return to_;
  }
  if (now <= ramp_start_)
  {
    return from_;
  }
  const double t = (now - ramp_start_) / (ramp_end_ - ramp_start_);
  return static_cast<float>(from_ + (to_ - from_) * t);
}

M5SourceNode::M5SourceNode(M5AudioOutput &owner, const std::vector<float> &samples, uint32_t sampleRate)
    : owner_(owner), samples_(samples), sample_rate_(sampleRate)
{
  pcm_.resize(samples_.size());
  std::transform(samples_.begin(), samples_.end(), pcm_.begin(), toPcm16);
}

void M5SourceNode::start(double when)
{
  start_time_ = when;
  owner_.enqueue(shared_from_this(), when);
}

double M5SourceNode::duration() const
{
  return sample_rate_ ? static_cast<double>(pcm_.size()) / sample_rate_ : 0.0;
}

M5AudioOutput::M5AudioOutput(uint8_t channel) : channel_(channel), queue_(kChannelDepth, kSubmitLead) {}

void M5AudioOutput::init()
{
  origin_us_ = esp_timer_get_time();
  queue_.clear();
  M5.Speaker.setChannelVolume(channel_, 255);
  last_volume_ = 255;
}

double M5AudioOutput::currentTime() const
{
  return static_cast<double>(esp_timer_get_time() - origin_us_) / 1000000.0;
}

bool M5AudioOutput::isSuspended() const
{
  return !M5.Speaker.isRunning();
}

bool M5AudioOutput::resume()
{
  // CoreS3 shares the I2S bus between mic and speaker
  if (M5.Mic.isEnabled())
  {
    M5.Mic.end();
  }
  bool ok = M5.Speaker.begin();
  log_i("M5.Speaker.begin() = %d", ok);
  return ok;
}

std::shared_ptr<SourceNode> M5AudioOutput::createSource(const std::vector<float> &samples, uint32_t sampleRate)
{
  if (queue_.inFlight() >= kMaxInFlight || sampleRate == 0)
  {
    return nullptr;
  }
  return std::make_shared<M5SourceNode>(*this, samples, sampleRate);
}

std::shared_ptr<GainStage> M5AudioOutput::createGain()
{
  return std::make_shared<M5GainStage>(*this);
}

void M5AudioOutput::enqueue(const std::shared_ptr<M5SourceNode> &node, double when)
{
  queue_.push(node, when);
}

void M5AudioOutput::loop()
{
  const double now = currentTime();
  reapFinished();
  queue_.submitDue(now, [this, now](const std::shared_ptr<M5SourceNode> &node) { return submit(node, now); });
  applyGain(now);
}

bool M5AudioOutput::submit(const std::shared_ptr<M5SourceNode> &node, double now)
{
  if (!M5.Speaker.playRaw(node->pcm_.data(), node->pcm_.size(), node->sample_rate_, false, 1, channel_))
  {
    if (!refusing_)
    {
      log_w("playRaw refused %u samples, retrying", (unsigned)node->pcm_.size());
      refusing_ = true;
    }
    return false;
  }
  refusing_ = false;
  log_d("playRaw %u samples at %.3f (due %.3f)", (unsigned)node->pcm_.size(), now, node->start_time_);
  if (node->stage_)
  {
    node->stage_->process(node->samples_.data(), node->samples_.size());
  }
  return true;
}

void M5AudioOutput::reapFinished()
{
  // isPlaying() counts the buffers still held by the channel
  const size_t held = M5.Speaker.isPlaying(channel_);
  for (const std::shared_ptr<M5SourceNode> &node : queue_.reap(held))
  {
    if (node->on_ended_)
    {
      SourceNode::EndedCallback cb = node->on_ended_;
      cb();
    }
  }
}

void M5AudioOutput::applyGain(double now)
{
  std::shared_ptr<M5SourceNode> playing = queue_.current();
  if (!playing)
  {
    return;
  }
  const std::shared_ptr<GainStage> &gain = playing->gain_;
  float value = 1.0f;
  if (gain)
  {
    value = static_cast<const M5GainStage &>(*gain).valueAt(now);
  }
  const uint8_t volume = static_cast<uint8_t>(std::min(1.0f, std::max(0.0f, value)) * 255.0f);
  if (volume != last_volume_)
  {
    M5.Speaker.setChannelVolume(channel_, volume);
    last_volume_ = volume;
  }
}
