#include <M5Unified.h>
#include "sr_recognition_engine.hpp"
#include <algorithm>

namespace
{
SrRecognitionEngine *g_sr = nullptr;
}

bool SrRecognitionEngine::init(const sr_cmd_t *commands, size_t count)
{
  g_sr = this;
  commands_ = commands;
  command_count_ = count;
  if (events_ == nullptr)
  {
    events_ = xQueueCreate(8, sizeof(PendingEvent));
  }

  ESP_SR_M5.onEvent(onSrEventForward);
  ready_ = ESP_SR_M5.begin(commands, count, SR_MODE_COMMAND);
  log_i("ESP_SR_M5.begin() = %d", ready_);
  if (ready_)
  {
    ESP_SR_M5.pause();
  }
  return ready_;
}

bool SrRecognitionEngine::start()
{
  if (!ready_)
  {
    return false;
  }
  if (!ESP_SR_M5.setMode(SR_MODE_COMMAND) || !ESP_SR_M5.resume())
  {
    log_w("ESP-SR resume failed");
    return false;
  }
  running_ = true;
  return true;
}

void SrRecognitionEngine::stop()
{
  if (!running_)
  {
    return;
  }
  running_ = false;
  ESP_SR_M5.pause();
  dispatch(RecognitionEvent::end());
}

void SrRecognitionEngine::feedAudio(const int16_t *samples, size_t count)
{
  if (running_)
  {
    ESP_SR_M5.feedAudio(samples, count);
  }
}

void SrRecognitionEngine::loop()
{
  if (events_ == nullptr)
  {
    return;
  }
  PendingEvent pending;
  while (xQueueReceive(events_, &pending, 0) == pdTRUE)
  {
    handleSrEvent(pending.event, pending.command_id, pending.phrase_id);
  }
}

// runs on the ESP-SR task; hand the event over to the main loop
void SrRecognitionEngine::onSrEventForward(sr_event_t event, int command_id, int phrase_id)
{
  if (g_sr == nullptr || g_sr->events_ == nullptr)
  {
    return;
  }
  PendingEvent pending{event, command_id, phrase_id};
  if (xQueueSend(g_sr->events_, &pending, 0) != pdTRUE)
  {
    log_w("SR event dropped: %d", event);
  }
}

void SrRecognitionEngine::handleSrEvent(sr_event_t event, int command_id, int phrase_id)
{
  switch (event)
  {
  case SR_EVENT_COMMAND:
    log_i("SR command id=%d phrase=%d", command_id, phrase_id);
    running_ = false;
    ESP_SR_M5.pause();
    dispatch(RecognitionEvent::result(phraseFor(command_id), true));
    dispatch(RecognitionEvent::end());
    break;
  case SR_EVENT_TIMEOUT:
    log_d("SR command timeout");
    running_ = false;
    ESP_SR_M5.pause();
    dispatch(RecognitionEvent::failure(RecognitionError::NoSpeech));
    dispatch(RecognitionEvent::end());
    break;
  default:
    log_i("Unknown SR Event: %d", event);
    break;
  }
}

const char *SrRecognitionEngine::phraseFor(int command_id) const
{
  for (size_t i = 0; i < command_count_; ++i)
  {
    if (commands_[i].command_id == command_id)
    {
      return commands_[i].str;
    }
  }
  return "";
}

SrFeedStage::SrFeedStage(SrRecognitionEngine &engine, uint32_t sourceRate, uint32_t targetRate)
    : engine_(engine), source_rate_(sourceRate), target_rate_(targetRate)
{
}

void SrFeedStage::setSourceRate(uint32_t rate)
{
  if (rate > 0)
  {
    source_rate_ = rate;
  }
}

void SrFeedStage::process(const float *samples, size_t count)
{
  LevelMeterStage::process(samples, count);
  if (samples == nullptr || count == 0 || !engine_.isRunning())
  {
    return;
  }

  // linear resample to the recognizer rate
  const double step = static_cast<double>(source_rate_) / target_rate_;
  const size_t out_count = static_cast<size_t>(count / step);
  scratch_.resize(out_count);
  for (size_t i = 0; i < out_count; ++i)
  {
    const double pos = i * step;
    const size_t idx = static_cast<size_t>(pos);
    const double frac = pos - idx;
    const float a = samples[idx];
    const float b = samples[std::min(idx + 1, count - 1)];
    float v = static_cast<float>(a + (b - a) * frac);
    v = std::min(1.0f, std::max(-1.0f, v));
    scratch_[i] = static_cast<int16_t>(v * 32767.0f);
  }
  engine_.feedAudio(scratch_.data(), scratch_.size());
}
