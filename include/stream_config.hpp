#pragma once

#include <cstddef>
#include <cstdint>

// Tuning knobs for one streaming session. Defaults match the reply stream
// the voice server produces (24kHz mono PCM16LE).
struct StreamConfig
{
  uint32_t output_sample_rate = 24000;
  uint32_t input_sample_rate = 16000;

  // samples per playback frame
  size_t buffer_size = 7680;

  // warm-up delay before the first frame of a session (seconds)
  double initial_buffer_time = 0.1;
  // how far ahead of the output clock frames may be queued (seconds)
  double schedule_ahead_time = 0.2;
  // the scheduling pass wakes this much before the queued audio runs out
  uint32_t schedule_margin_ms = 50;

  double stop_ramp_time = 0.1;
  uint32_t gain_swap_delay_ms = 200;

  uint32_t recognition_restart_delay_ms = 100;

  // uplink chunk size handed to the transport
  size_t mic_chunk_samples = 2048;
};
