#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include <ESP_SR_M5Unified.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include "processing_stage.hpp"
#include "recognition_engine.hpp"

// ESP-SR command recognition as a RecognitionEngine. A matched command is a
// final result followed by End; a command timeout is a no-speech error
// followed by End.
class SrRecognitionEngine : public RecognitionEngine
{
public:
  // registers the ESP-SR event handler and loads the command list (paused)
  bool init(const sr_cmd_t *commands, size_t count);

  bool start() override;
  void stop() override;

  bool isRunning() const { return running_; }

  // 16kHz mono PCM
  void feedAudio(const int16_t *samples, size_t count);

  // Delivers events queued by the ESP-SR task; call every loop()
  void loop();

private:
  struct PendingEvent
  {
    sr_event_t event;
    int command_id;
    int phrase_id;
  };

  static void onSrEventForward(sr_event_t event, int command_id, int phrase_id);
  void handleSrEvent(sr_event_t event, int command_id, int phrase_id);
  const char *phraseFor(int command_id) const;

  QueueHandle_t events_ = nullptr;
  const sr_cmd_t *commands_ = nullptr;
  size_t command_count_ = 0;
  bool ready_ = false;
  bool running_ = false;
};

// Level meter that also feeds the played reply to ESP-SR, resampled to the
// recognizer rate.
class SrFeedStage : public LevelMeterStage
{
public:
  SrFeedStage(SrRecognitionEngine &engine, uint32_t sourceRate, uint32_t targetRate);

  void process(const float *samples, size_t count) override;

  void setSourceRate(uint32_t rate);

private:
  SrRecognitionEngine &engine_;
  uint32_t source_rate_;
  const uint32_t target_rate_;
  std::vector<int16_t> scratch_;
};
