#include "mic.hpp"
#include <WiFi.h>
#include <algorithm>
#include <cstring>
#include <vector>

Mic::Mic(WebSocketsClient &ws, int sampleRate, size_t chunkSamples)
    : ws_(ws), sample_rate_(sampleRate), chunk_samples_(chunkSamples),
      ring_capacity_samples_(std::max(chunkSamples * 4, static_cast<size_t>(sampleRate) * 2))
{
}

Mic::~Mic()
{
  if (ring_buffer_)
  {
    heap_caps_free(ring_buffer_);
  }
}

void Mic::init()
{
  if (ring_buffer_)
  {
    heap_caps_free(ring_buffer_);
    ring_buffer_ = nullptr;
  }
  ring_buffer_ = (int16_t *)heap_caps_malloc(ring_capacity_samples_ * sizeof(int16_t), MALLOC_CAP_8BIT);
  if (ring_buffer_)
  {
    memset(ring_buffer_, 0, ring_capacity_samples_ * sizeof(int16_t));
  }
  else
  {
    log_e("mic ring buffer allocation failed (%u samples)", (unsigned)ring_capacity_samples_);
  }
  ring_write_ = ring_read_ = ring_available_ = 0;
  seq_counter_ = 0;
  streaming_ = false;
  held_ = false;
}

bool Mic::start()
{
  if (ring_buffer_ == nullptr)
  {
    return false;
  }
  if (!M5.Mic.isEnabled() && !M5.Mic.begin())
  {
    log_w("mic acquisition failed");
    return false;
  }

  ring_write_ = ring_read_ = ring_available_ = 0;
  seq_counter_ = 0;
  held_ = false;
  streaming_ = sendPacket(MessageType::START, nullptr, 0);
  return streaming_;
}

bool Mic::stop()
{
  if (!streaming_)
  {
    return true;
  }

  // flush remaining samples before END
  bool ok = true;
  std::vector<int16_t> tail_buf(chunk_samples_);
  while (ring_available_ > 0)
  {
    size_t sent = ringPop(tail_buf.data(), chunk_samples_);
    if (!sendPacket(MessageType::DATA, tail_buf.data(), sent))
    {
      ok = false;
      break;
    }
  }

  streaming_ = false;
  ok = sendPacket(MessageType::END, nullptr, 0) && ok;
  M5.Mic.end();
  return ok;
}

void Mic::hold()
{
  held_ = true;
  M5.Mic.end();
}

bool Mic::release()
{
  held_ = false;
  if (!streaming_)
  {
    return true;
  }
  if (M5.Speaker.isRunning())
  {
    M5.Speaker.end();
  }
  if (!M5.Mic.begin())
  {
    log_w("mic acquisition failed after playback");
    return false;
  }
  return true;
}

bool Mic::loop()
{
  if (!streaming_ || held_)
  {
    return true;
  }

  static int16_t mic_buf[256];
  if (M5.Mic.isEnabled())
  {
    if (M5.Mic.record(mic_buf, mic_read_samples_, sample_rate_))
    {
      ringPush(mic_buf, mic_read_samples_);
    }
  }

  static std::vector<int16_t> send_buf;
  if (send_buf.size() < chunk_samples_)
  {
    send_buf.resize(chunk_samples_);
  }
  while (ring_available_ >= chunk_samples_)
  {
    size_t got = ringPop(send_buf.data(), chunk_samples_);
    if (!sendPacket(MessageType::DATA, send_buf.data(), got))
    {
      streaming_ = false;
      log_i("WS send failed (data)");
      return false;
    }
  }
  return true;
}

bool Mic::sendPacket(MessageType type, const int16_t *samples, size_t sampleCount)
{
  if ((WiFi.status() != WL_CONNECTED) || !ws_.isConnected())
  {
    return false;
  }

  WsHeader header{};
  header.kind = static_cast<uint8_t>(MessageKind::AudioPcm);
  header.messageType = static_cast<uint8_t>(type);
  header.reserved = 0;
  header.seq = seq_counter_++;
  header.payloadBytes = static_cast<uint16_t>(sampleCount * sizeof(int16_t));

  std::vector<uint8_t> packet(sizeof(WsHeader) + header.payloadBytes);
  memcpy(packet.data(), &header, sizeof(WsHeader));
  if (header.payloadBytes > 0 && samples != nullptr)
  {
    memcpy(packet.data() + sizeof(WsHeader), samples, header.payloadBytes);
  }

  return ws_.sendBIN(packet.data(), packet.size());
}

void Mic::ringPush(const int16_t *src, size_t samples)
{
  if (samples == 0)
  {
    return;
  }

  if (samples > ring_capacity_samples_)
  {
    src += (samples - ring_capacity_samples_);
    samples = ring_capacity_samples_;
  }

  // overwrite the oldest samples when full
  size_t overflow = (ring_available_ + samples > ring_capacity_samples_) ? (ring_available_ + samples - ring_capacity_samples_) : 0;
  if (overflow > 0)
  {
    ring_read_ = (ring_read_ + overflow) % ring_capacity_samples_;
    ring_available_ -= overflow;
  }

  size_t first = std::min(samples, ring_capacity_samples_ - ring_write_);
  memcpy(ring_buffer_ + ring_write_, src, first * sizeof(int16_t));
  if (samples > first)
  {
    memcpy(ring_buffer_, src + first, (samples - first) * sizeof(int16_t));
  }
  ring_write_ = (ring_write_ + samples) % ring_capacity_samples_;
  ring_available_ += samples;
}

size_t Mic::ringPop(int16_t *dst, size_t samples)
{
  size_t to_read = std::min(samples, ring_available_);
  if (to_read == 0)
  {
    return 0;
  }

  size_t first = std::min(to_read, ring_capacity_samples_ - ring_read_);
  memcpy(dst, ring_buffer_ + ring_read_, first * sizeof(int16_t));
  if (to_read > first)
  {
    memcpy(dst + first, ring_buffer_, (to_read - first) * sizeof(int16_t));
  }
  ring_read_ = (ring_read_ + to_read) % ring_capacity_samples_;
  ring_available_ -= to_read;
  return to_read;
}
