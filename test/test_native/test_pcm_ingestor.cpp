/**
 * PCM ingestion tests
 *
 * Decoding of PCM16LE, rebuffering into fixed frames, odd-byte handling and
 * the final short frame.
 */

#include <unity.h>

#include <deque>
#include <vector>
#include "pcm_ingestor.hpp"
#include "mocks/speaker_rig.hpp"

void test_half_frame_chunks_make_one_frame_on_second_call()
{
  PcmIngestor ingestor(7680);
  std::deque<PlaybackFrame> frames;
  std::vector<uint8_t> chunk = mocks::pcmRamp(3840);
  TEST_ASSERT_EQUAL(15360, chunk.size());

  TEST_ASSERT_EQUAL(0, ingestor.ingest(chunk.data(), chunk.size(), frames));
  TEST_ASSERT_EQUAL(0, frames.size());
  TEST_ASSERT_EQUAL(3840, ingestor.pendingSamples());

  TEST_ASSERT_EQUAL(1, ingestor.ingest(chunk.data(), chunk.size(), frames));
  TEST_ASSERT_EQUAL(1, frames.size());
  TEST_ASSERT_EQUAL(7680, frames.front().size());
  TEST_ASSERT_EQUAL(0, ingestor.pendingSamples());
}

void test_frame_count_and_remainder_follow_sample_count()
{
  PcmIngestor ingestor(1000);
  std::deque<PlaybackFrame> frames;
  std::vector<uint8_t> chunk = mocks::pcmRamp(6173);

  TEST_ASSERT_EQUAL(6, ingestor.ingest(chunk.data(), chunk.size(), frames));
  TEST_ASSERT_EQUAL(6, frames.size());
  TEST_ASSERT_EQUAL(173, ingestor.pendingSamples());
  for (const auto &frame : frames)
  {
    TEST_ASSERT_EQUAL(1000, frame.size());
  }
}

void test_samples_are_normalized_by_32768()
{
  PcmIngestor ingestor(4);
  std::deque<PlaybackFrame> frames;
  const uint8_t bytes[] = {
      0x00, 0x80, // -32768
      0xFF, 0x7F, // 32767
      0x00, 0x40, // 16384
      0xFF, 0xFF, // -1
  };

  TEST_ASSERT_EQUAL(1, ingestor.ingest(bytes, sizeof(bytes), frames));
  const PlaybackFrame &frame = frames.front();
  TEST_ASSERT_EQUAL_FLOAT(-1.0f, frame[0]);
  TEST_ASSERT_EQUAL_FLOAT(32767.0f / 32768.0f, frame[1]);
  TEST_ASSERT_TRUE(frame[1] < 1.0f);
  TEST_ASSERT_EQUAL_FLOAT(0.5f, frame[2]);
  TEST_ASSERT_EQUAL_FLOAT(-1.0f / 32768.0f, frame[3]);
}

void test_trailing_odd_byte_is_dropped()
{
  PcmIngestor ingestor(8);
  std::deque<PlaybackFrame> frames;
  const uint8_t bytes[] = {0x01, 0x00, 0x02, 0x00, 0x7F};

  TEST_ASSERT_EQUAL(0, ingestor.ingest(bytes, sizeof(bytes), frames));
  TEST_ASSERT_EQUAL(2, ingestor.pendingSamples());
}

void test_empty_and_null_chunks_are_harmless()
{
  PcmIngestor ingestor(8);
  std::deque<PlaybackFrame> frames;

  TEST_ASSERT_EQUAL(0, ingestor.ingest(nullptr, 10, frames));
  TEST_ASSERT_EQUAL(0, ingestor.ingest(nullptr, 0, frames));
  TEST_ASSERT_EQUAL(0, ingestor.pendingSamples());
  TEST_ASSERT_EQUAL(0, frames.size());
}

void test_flush_emits_short_final_frame_once()
{
  PcmIngestor ingestor(7680);
  std::deque<PlaybackFrame> frames;
  std::vector<uint8_t> chunk = mocks::pcmRamp(3000);
  ingestor.ingest(chunk.data(), chunk.size(), frames);

  TEST_ASSERT_TRUE(ingestor.flush(frames));
  TEST_ASSERT_EQUAL(1, frames.size());
  TEST_ASSERT_EQUAL(3000, frames.front().size());
  TEST_ASSERT_EQUAL(0, ingestor.pendingSamples());
  TEST_ASSERT_FALSE(ingestor.flush(frames));
  TEST_ASSERT_EQUAL(1, frames.size());
}

void test_frames_preserve_sample_order_across_uneven_chunks()
{
  PcmIngestor ingestor(100);
  std::deque<PlaybackFrame> frames;
  std::vector<uint8_t> all = mocks::pcmRamp(1037, -500);

  const size_t cuts[] = {3, 250, 1, 777, 40};
  size_t offset = 0;
  for (size_t cut : cuts)
  {
    // cuts are byte counts; odd ones are rounded up to keep pairs intact
    size_t len = (cut + 1) & ~static_cast<size_t>(1);
    ingestor.ingest(all.data() + offset, len, frames);
    offset += len;
  }
  ingestor.ingest(all.data() + offset, all.size() - offset, frames);
  ingestor.flush(frames);

  std::vector<float> joined;
  for (const auto &frame : frames)
  {
    joined.insert(joined.end(), frame.begin(), frame.end());
  }
  TEST_ASSERT_EQUAL(1037, joined.size());
  for (size_t i = 0; i < joined.size(); ++i)
  {
    TEST_ASSERT_EQUAL_FLOAT(PcmIngestor::normalize(static_cast<int16_t>(-500 + static_cast<int>(i))), joined[i]);
  }
}

void test_clear_discards_partial_samples()
{
  PcmIngestor ingestor(100);
  std::deque<PlaybackFrame> frames;
  std::vector<uint8_t> chunk = mocks::pcmRamp(42);
  ingestor.ingest(chunk.data(), chunk.size(), frames);

  ingestor.clear();
  TEST_ASSERT_EQUAL(0, ingestor.pendingSamples());
  TEST_ASSERT_FALSE(ingestor.flush(frames));
}

void run_pcm_ingestor_tests()
{
  RUN_TEST(test_half_frame_chunks_make_one_frame_on_second_call);
  RUN_TEST(test_frame_count_and_remainder_follow_sample_count);
  RUN_TEST(test_samples_are_normalized_by_32768);
  RUN_TEST(test_trailing_odd_byte_is_dropped);
  RUN_TEST(test_empty_and_null_chunks_are_harmless);
  RUN_TEST(test_flush_emits_short_final_frame_once);
  RUN_TEST(test_frames_preserve_sample_order_across_uneven_chunks);
  RUN_TEST(test_clear_discards_partial_samples);
}
