#include "speaker.hpp"
#include <cstring>
#include <utility>

Speaker::Speaker(StateMachine &sm, AudioOutput &output, TimerService &timers, RecognitionEngine &engine,
                 ProcessingRegistry &registry, SessionLog &log, const StreamConfig &config)
    : state_(sm), output_(output), registry_(registry), log_(log), config_(config),
      ingestor_(config_.buffer_size),
      tracker_([this]() { return scheduler_.queuedFrames() > 0 || ingestor_.pendingSamples() > 0; }),
      scheduler_(output, timers, ingestor_, tracker_, log, config_),
      recognition_(engine, timers, log, SessionLog::Source::Remote, config_.recognition_restart_delay_ms)
{
  tracker_.setOnComplete([this]() { finishSession(); });
  // an engine that ends by itself is revived only while the reply is still arriving,
  // a silence timeout is retried until the last frame has played
  recognition_.setKeepAliveCheck([this]() { return state_.isPlaying(); });
  recognition_.setSessionCheck([this]() { return state_.isActive(); });
}

void Speaker::init()
{
  if (!events_registered_)
  {
    events_registered_ = true;
    for (int s = StateMachine::Idle; s <= StateMachine::Stopped; ++s)
    {
      state_.addStateEntryEvent(static_cast<StateMachine::State>(s),
                                [this](StateMachine::State prev, StateMachine::State next) {
                                  log_.logf(SessionLog::Level::Info, "State change: %s -> %s",
                                            StateMachine::stateToString(prev), StateMachine::stateToString(next));
                                });
    }
    state_.addStateEntryEvent(StateMachine::Stopped, [this](StateMachine::State, StateMachine::State) {
      recognition_.stop();
    });
  }
}

void Speaker::handleAudioMessage(const WsHeader &hdr, const uint8_t *body, size_t bodyLen)
{
  auto msgType = static_cast<MessageType>(hdr.messageType);

  if (msgType == MessageType::START)
  {
    if (state_.isActive())
    {
      log_.logf(SessionLog::Level::Warn, "reply START while playing, cutting previous reply");
      stop();
    }
    if (!resume())
    {
      streaming_ = false;
      return;
    }
    streaming_ = true;
    next_seq_ = hdr.seq + 1;

    uint32_t sr = config_.output_sample_rate;
    if (body && bodyLen >= 6)
    {
      uint16_t ch = 1;
      memcpy(&sr, body, sizeof(sr));
      memcpy(&ch, body + sizeof(sr), sizeof(ch));
      if (ch > 1)
      {
        log_.logf(SessionLog::Level::Warn, "reply has %u channels, playing as mono", (unsigned)ch);
      }
      log_.logf(SessionLog::Level::Info, "reply meta: sample_rate=%u channels=%u", (unsigned)sr, (unsigned)ch);
    }
    else
    {
      log_.logf(SessionLog::Level::Warn, "reply START without meta, fallback sr=%u", (unsigned)sr);
    }
    scheduler_.setSampleRate(sr);
    log_.logf(SessionLog::Level::Info, "reply stream start seq=%u", (unsigned)hdr.seq);
    return;
  }

  if (msgType == MessageType::DATA)
  {
    if (!streaming_)
    {
      log_.logf(SessionLog::Level::Warn, "reply DATA without START");
      return;
    }

    if (hdr.seq != next_seq_)
    {
      // TCP guarantees order; a gap means the server skipped, so just resync
      log_.logf(SessionLog::Level::Warn, "reply seq gap: got=%u expected=%u", (unsigned)hdr.seq, (unsigned)next_seq_);
      next_seq_ = hdr.seq + 1;
    }
    else
    {
      next_seq_++;
    }

    ingest(body, bodyLen);
    return;
  }

  if (msgType == MessageType::END)
  {
    if (!streaming_)
    {
      log_.logf(SessionLog::Level::Warn, "reply END without START");
      return;
    }
    streaming_ = false;
    next_seq_ = 0;
    complete();
    return;
  }

  if (msgType == MessageType::CANCEL)
  {
    log_.logf(SessionLog::Level::Info, "reply cancelled by server");
    stop();
    return;
  }

  log_.logf(SessionLog::Level::Warn, "unknown reply message type=%u", (unsigned)hdr.messageType);
}

void Speaker::ingest(const uint8_t *data, size_t len)
{
  recognition_.start();

  if (len % sizeof(int16_t) != 0)
  {
    log_.logf(SessionLog::Level::Debug, "chunk of %u bytes, dropping trailing byte", (unsigned)len);
  }
  const bool late = state_.isDraining();
  if (late)
  {
    log_.logf(SessionLog::Level::Warn, "chunk after complete(), appending anyway");
  }

  size_t frames = ingestor_.ingest(data, len, scheduler_.queue());
  if (late && ingestor_.flush(scheduler_.queue()))
  {
    // nothing more will arrive to fill the remainder
    frames++;
  }
  log_.logf(SessionLog::Level::Debug, "chunk size=%u frames=%u queued=%u pending=%u", (unsigned)len,
            (unsigned)frames, (unsigned)scheduler_.queuedFrames(), (unsigned)ingestor_.pendingSamples());

  if (!state_.isActive())
  {
    beginSession();
  }
  else
  {
    scheduler_.kick();
  }
}

void Speaker::complete()
{
  if (state_.isStopped())
  {
    log_.logf(SessionLog::Level::Warn, "complete() on a stopped session ignored");
    return;
  }

  log_.logf(SessionLog::Level::Info, "marking reply stream complete");
  if (!tracker_.isOpen())
  {
    // nothing was ever ingested
    tracker_.begin();
  }
  tracker_.markStreamComplete();
  if (state_.isPlaying())
  {
    state_.setState(StateMachine::Draining);
  }

  if (ingestor_.flush(scheduler_.queue()))
  {
    log_.logf(SessionLog::Level::Debug, "flushed final short frame");
    scheduler_.scheduleNextBuffer();
  }
  else if (scheduler_.queuedFrames() > 0)
  {
    scheduler_.kick();
  }
  else
  {
    tracker_.tryFire();
  }
}

void Speaker::stop()
{
  streaming_ = false;
  next_seq_ = 0;

  scheduler_.stop();
  ingestor_.clear();
  state_.setState(StateMachine::Stopped);
  recognition_.stop();

  // fires the callback only if a session was still open
  tracker_.abort();
}

bool Speaker::resume()
{
  if (output_.isSuspended() && !output_.resume())
  {
    log_.logf(SessionLog::Level::Error, "audio output did not resume");
    return false;
  }

  const bool playing = state_.isActive();
  if (state_.isStopped())
  {
    state_.setState(StateMachine::Idle);
  }
  scheduler_.resetClock(playing);
  scheduler_.restoreGain();
  return true;
}

bool Speaker::addProcessor(const std::string &name, const ProcessingRegistry::Loader &load,
                           ProcessingStage::Handler handler)
{
  std::shared_ptr<ProcessingStage> stage = registry_.attach(output_, name, load, std::move(handler));
  if (!stage)
  {
    log_.logf(SessionLog::Level::Error, "processing stage '%s' failed to load", name.c_str());
    return false;
  }
  scheduler_.setProcessor(stage);
  return true;
}

void Speaker::beginSession()
{
  tracker_.begin();
  state_.setState(StateMachine::Playing);
  scheduler_.begin();
}

void Speaker::finishSession()
{
  log_.logf(SessionLog::Level::Info, "reply session closed");
  state_.setState(StateMachine::Stopped);
  if (on_complete_)
  {
    on_complete_();
  }
}
