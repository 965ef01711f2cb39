#include "pcm_ingestor.hpp"
#include <utility>

PcmIngestor::PcmIngestor(size_t frameSamples)
    : frame_samples_(frameSamples > 0 ? frameSamples : 1)
{
}

size_t PcmIngestor::ingest(const uint8_t *data, size_t len, std::deque<PlaybackFrame> &out)
{
  const size_t sample_count = (data != nullptr) ? len / sizeof(int16_t) : 0;

  // frames handed out never share storage with the accumulator
  std::vector<float> merged;
  merged.reserve(accumulation_.size() + sample_count);
  merged.insert(merged.end(), accumulation_.begin(), accumulation_.end());
  for (size_t i = 0; i < sample_count; ++i)
  {
    const uint16_t raw = static_cast<uint16_t>(data[2 * i]) | (static_cast<uint16_t>(data[2 * i + 1]) << 8);
    merged.push_back(normalize(static_cast<int16_t>(raw)));
  }

  size_t produced = 0;
  size_t offset = 0;
  while (merged.size() - offset >= frame_samples_)
  {
    out.emplace_back(merged.begin() + offset, merged.begin() + offset + frame_samples_);
    offset += frame_samples_;
    produced++;
  }

  accumulation_.assign(merged.begin() + offset, merged.end());
  return produced;
}

bool PcmIngestor::flush(std::deque<PlaybackFrame> &out)
{
  if (accumulation_.empty())
  {
    return false;
  }
  out.push_back(std::move(accumulation_));
  accumulation_ = std::vector<float>();
  return true;
}

void PcmIngestor::clear()
{
  accumulation_ = std::vector<float>();
}
