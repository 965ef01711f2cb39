#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

// Fixed-length block of normalized samples, [-1.0, 1.0). The last frame of a
// stream may be shorter.
using PlaybackFrame = std::vector<float>;

// Turns PCM16LE chunks of any size into fixed-size playback frames.
class PcmIngestor
{
public:
  explicit PcmIngestor(size_t frameSamples);

  // Decodes `len` bytes and appends every completed frame to `out`.
  // A trailing odd byte is dropped. Returns the number of frames produced.
  size_t ingest(const uint8_t *data, size_t len, std::deque<PlaybackFrame> &out);

  // Moves the partial remainder into `out` as a final short frame.
  // Returns false if there was nothing to flush.
  bool flush(std::deque<PlaybackFrame> &out);

  void clear();

  size_t pendingSamples() const { return accumulation_.size(); }
  size_t frameSamples() const { return frame_samples_; }

  static float normalize(int16_t sample) { return static_cast<float>(sample) / 32768.0f; }

private:
  const size_t frame_samples_;
  std::vector<float> accumulation_;
};
