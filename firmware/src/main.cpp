// Arduino IDE: board = ESP32S3系, ライブラリ: M5Unified, Links2004/WebSocketsClient, ESP_SR_M5Unified
// 事前に: include/config.template.h を config.h にコピーして設定を書き換える

#include <M5Unified.h>
#include <ESP_SR_M5Unified.h>
#include <WiFi.h>
#include <WebSocketsClient.h>
#include <cstring>
#include <memory>
#include "config.h"
#include "protocols.hpp"
#include "state_machine.hpp"
#include "speaker.hpp"
#include "stream_config.hpp"
#include "processing_registry.hpp"
#include "display.hpp"
#include "mic.hpp"
#include "m5_audio_output.hpp"
#include "loop_timer_service.hpp"
#include "sr_recognition_engine.hpp"

//////////////////// 設定 ////////////////////
const char *WIFI_SSID = WIFI_SSID_H;
const char *WIFI_PASS = WIFI_PASSWORD_H;
const char *SERVER_HOST = SERVER_HOST_H;
const int SERVER_PORT = SERVER_PORT_H;
const char *SERVER_PATH = SERVER_PATH_H; // WebSocket エンドポイント
/////////////////////////////////////////////

namespace
{
StreamConfig makeStreamConfig()
{
  StreamConfig config;
  config.input_sample_rate = MIC_SAMPLE_RATE_H;
  config.output_sample_rate = REPLY_SAMPLE_RATE_H;
  return config;
}

// phrases ESP-SR listens for in the reply
const sr_cmd_t kSrCommands[] = {
    {0, "Turn on the light", "TkN nN jc LiT"},
    {1, "Turn off the light", "TkN eF jc LiT"},
    {2, "Start fan", "STnRT FaN"},
    {3, "Stop fan", "STnP FaN"},
};
} // namespace

static const StreamConfig streamConfig = makeStreamConfig();

StateMachine stateMachine;

static WebSocketsClient wsClient;
static Display display(stateMachine);
static M5AudioOutput audioOutput;
static LoopTimerService timers;
static SrRecognitionEngine srEngine;
static ProcessingRegistry processingRegistry;
static Speaker speaker(stateMachine, audioOutput, timers, srEngine, processingRegistry, display, streamConfig);
static Mic mic(wsClient, MIC_SAMPLE_RATE_H, streamConfig.mic_chunk_samples);
static std::shared_ptr<SrFeedStage> srFeed;

void connectWiFi()
{
  WiFi.mode(WIFI_STA);
  WiFi.begin(WIFI_SSID, WIFI_PASS);
  while (WiFi.status() != WL_CONNECTED)
  {
    delay(300);
  }
}

void handleWsEvent(WStype_t type, uint8_t *payload, size_t length)
{
  switch (type)
  {
  case WStype_DISCONNECTED:
    log_i("WS disconnected");
    speaker.stop();
    mic.stop();
    break;
  case WStype_CONNECTED:
    log_i("WS connected to %s", SERVER_PATH);
    if (!mic.start())
    {
      log_w("Failed to start Mic streaming");
    }
    break;
  case WStype_TEXT:
    break;
  case WStype_BIN:
  {
    if (length < sizeof(WsHeader))
    {
      log_w("WS bin too short: %d", (int)length);
      break;
    }

    WsHeader rx{};
    memcpy(&rx, payload, sizeof(WsHeader));
    size_t rx_payload_len = length - sizeof(WsHeader);
    if (rx_payload_len != rx.payloadBytes)
    {
      log_w("WS payload len mismatch: expected=%u got=%u", (unsigned)rx.payloadBytes, (unsigned)rx_payload_len);
      break;
    }

    const uint8_t *body = payload + sizeof(WsHeader);
    log_d("WS bin kind=%u len=%d", (unsigned)rx.kind, (int)length);

    switch (static_cast<MessageKind>(rx.kind))
    {
    case MessageKind::AudioReply:
      speaker.handleAudioMessage(rx, body, rx_payload_len);
      break;
    default:
      log_w("WS bin unexpected kind=%u", (unsigned)rx.kind);
      break;
    }

    break;
  }
  default:
    break;
  }
}

void setup()
{
  auto cfg = M5.config();
  M5.begin(cfg);
  auto mic_cfg = M5.Mic.config();
  mic_cfg.sample_rate = MIC_SAMPLE_RATE_H;
  mic_cfg.stereo = false;
  M5.Mic.config(mic_cfg);

  display.init();
  mic.init();
  audioOutput.init();
  M5.Speaker.setVolume(SPEAKER_VOLUME_H);

  connectWiFi();
  log_i("WiFi: %s", WiFi.localIP().toString().c_str());

  // mic and speaker share the I2S bus
  stateMachine.addStateEntryEvent(StateMachine::Playing, [](StateMachine::State, StateMachine::State) {
    mic.hold();
  });
  stateMachine.addStateEntryEvent(StateMachine::Stopped, [](StateMachine::State, StateMachine::State) {
    if (!mic.release())
    {
      log_w("Mic did not come back after playback");
    }
  });
  speaker.init();
  speaker.setOnComplete([]() { log_i("reply done"); });

  if (!srEngine.init(kSrCommands, sizeof(kSrCommands) / sizeof(kSrCommands[0])))
  {
    log_w("ESP-SR unavailable, reply transcripts disabled");
  }
  bool meter_ok = speaker.addProcessor(
      "sr-feed",
      []() {
        srFeed = std::make_shared<SrFeedStage>(srEngine, streamConfig.output_sample_rate,
                                               streamConfig.input_sample_rate);
        return std::static_pointer_cast<ProcessingStage>(srFeed);
      },
      [](const ProcessingStage::Message &msg) {
        if (msg.event == "volume")
        {
          display.setVolume(msg.value);
        }
      });
  log_i("level meter attached = %d", meter_ok);

  wsClient.begin(SERVER_HOST, SERVER_PORT, SERVER_PATH);
  wsClient.onEvent(handleWsEvent);
  wsClient.setReconnectInterval(2000);
  wsClient.enableHeartbeat(15000, 3000, 2);
}

void loop()
{
  M5.update();
  wsClient.loop();
  srEngine.loop();
  timers.loop();

  if (srFeed)
  {
    srFeed->setSourceRate(speaker.sampleRate());
  }
  audioOutput.loop();

  if (!mic.loop())
  {
    log_i("Mic streaming stopped after send failure");
  }

  display.loop();
}
