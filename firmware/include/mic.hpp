#pragma once

#include <cstddef>
#include <cstdint>
#include <WebSocketsClient.h>
#include <M5Unified.h>
#include "protocols.hpp"

// Uplink capture: records the microphone and streams PCM16LE to the server
// as AudioPcm START/DATA/END frames.
class Mic
{
public:
  Mic(WebSocketsClient &ws, int sampleRate, size_t chunkSamples);
  ~Mic();

  // allocate buffers / reset counters; call once from setup
  void init();

  // Enables the microphone and sends START. false if the microphone could not
  // be acquired or WS is not connected.
  bool start();

  // flush remaining DATA and send END
  bool stop();

  // record and send full chunks; returns false on send failure
  bool loop();

  // Releases the I2S bus while a reply plays; capture resumes on release.
  void hold();
  bool release();

  bool isStreaming() const { return streaming_; }

private:
  bool sendPacket(MessageType type, const int16_t *samples, size_t sampleCount);
  void ringPush(const int16_t *src, size_t samples);
  size_t ringPop(int16_t *dst, size_t samples);

  WebSocketsClient &ws_;

  const int sample_rate_;
  const size_t chunk_samples_;
  const size_t mic_read_samples_ = 256;
  const size_t ring_capacity_samples_;

  int16_t *ring_buffer_ = nullptr;
  size_t ring_write_ = 0;
  size_t ring_read_ = 0;
  size_t ring_available_ = 0;

  uint16_t seq_counter_ = 0;
  bool streaming_ = false;
  bool held_ = false;
};
