#include "playback_scheduler.hpp"
#include <algorithm>
#include <utility>

PlaybackScheduler::PlaybackScheduler(AudioOutput &output, TimerService &timers, const PcmIngestor &ingestor,
                                     CompletionTracker &tracker, SessionLog &log, const StreamConfig &config)
    : output_(output), ingestor_(ingestor), tracker_(tracker), log_(log), config_(config),
      gain_(output.createGain()), sample_rate_(config.output_sample_rate),
      pass_task_(timers, [this]() { scheduleNextBuffer(); }),
      gain_swap_task_(timers, [this]() { swapGain(); })
{
}

void PlaybackScheduler::begin()
{
  // a fade from the previous stop must not swallow the new session
  if (gain_swap_task_.isArmed())
  {
    gain_swap_task_.cancel();
    swapGain();
  }

  scheduled_time_ = output_.currentTime() + config_.initial_buffer_time;
  log_.logf(SessionLog::Level::Info, "playback start, first frame at %.3f", scheduled_time_);
  scheduleNextBuffer();
}

void PlaybackScheduler::kick()
{
  if (pass_task_.isArmed())
  {
    return;
  }
  scheduleNextBuffer();
}

void PlaybackScheduler::scheduleNextBuffer()
{
  pass_task_.cancel();

  const double now = output_.currentTime();
  while (!queue_.empty() && scheduled_time_ < now + config_.schedule_ahead_time)
  {
    std::shared_ptr<SourceNode> source = output_.createSource(queue_.front(), sample_rate_);
    if (!source)
    {
      // keep the frame at the head and retry on the next pass
      log_.logf(SessionLog::Level::Warn, "output refused a source, %u frames waiting",
                static_cast<unsigned>(queue_.size()));
      break;
    }
    queue_.pop_front();

    if (queue_.empty())
    {
      tracker_.trackTail(source);
    }

    source->connect(gain_);
    if (processor_)
    {
      source->connect(processor_);
    }

    const double start_time = std::max(scheduled_time_, now);
    source->start(start_time);
    log_.logf(SessionLog::Level::Debug, "frame scheduled at %.3f (%u queued)", start_time,
              static_cast<unsigned>(queue_.size()));

    scheduled_time_ = start_time + source->duration();
  }

  if (queue_.empty() && ingestor_.pendingSamples() == 0)
  {
    if (tracker_.isStreamComplete())
    {
      log_.logf(SessionLog::Level::Info, "stream fully scheduled");
      tracker_.tryFire();
    }
    // otherwise idle until the next chunk kicks us
    return;
  }

  const double lead_ms = (scheduled_time_ - output_.currentTime()) * 1000.0;
  const double delay_ms = lead_ms - static_cast<double>(config_.schedule_margin_ms);
  pass_task_.armAfter(delay_ms > 0.0 ? static_cast<uint32_t>(delay_ms) : 0);
}

void PlaybackScheduler::stop()
{
  queue_.clear();
  pass_task_.cancel();

  const double now = output_.currentTime();
  scheduled_time_ = now;

  gain_->linearRampToValueAtTime(0.0f, now + config_.stop_ramp_time);
  gain_swap_task_.armAfter(config_.gain_swap_delay_ms);
}

void PlaybackScheduler::resetClock(bool playing)
{
  const double warm = output_.currentTime() + config_.initial_buffer_time;
  scheduled_time_ = playing ? std::max(scheduled_time_, warm) : warm;
}

void PlaybackScheduler::restoreGain()
{
  gain_->setValueAtTime(1.0f, output_.currentTime());
}

void PlaybackScheduler::setSampleRate(uint32_t sampleRate)
{
  if (sampleRate > 0)
  {
    sample_rate_ = sampleRate;
  }
}

void PlaybackScheduler::swapGain()
{
  gain_->disconnect();
  gain_ = output_.createGain();
  log_.logf(SessionLog::Level::Debug, "gain stage replaced");
}
