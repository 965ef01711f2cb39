#include "recognition_coordinator.hpp"
#include <utility>

const char *recognitionErrorToString(RecognitionError error)
{
  switch (error)
  {
  case RecognitionError::None:
    return "none";
  case RecognitionError::NoSpeech:
    return "no-speech";
  case RecognitionError::Aborted:
    return "aborted";
  case RecognitionError::AudioCapture:
    return "audio-capture";
  case RecognitionError::NotAllowed:
    return "not-allowed";
  case RecognitionError::Other:
  default:
    return "other";
  }
}

RecognitionCoordinator::RecognitionCoordinator(RecognitionEngine &engine, TimerService &timers, SessionLog &log,
                                               SessionLog::Source source, uint32_t restartDelayMs)
    : engine_(engine), log_(log), source_(source), restart_delay_ms_(restartDelayMs),
      restart_task_(timers, [this]() { onRestartDue(); })
{
  engine_.setEventHandler([this](const RecognitionEvent &event) { handleEvent(event); });
}

RecognitionCoordinator::~RecognitionCoordinator()
{
  engine_.setEventHandler(nullptr);
}

void RecognitionCoordinator::start()
{
  if (active_)
  {
    return;
  }

  hard_failed_ = false;
  if (!engine_.start())
  {
    log_.logf(SessionLog::Level::Warn, "recognition start refused (%s)", SessionLog::sourceToString(source_));
    active_ = false;
    return;
  }
  active_ = true;
  log_.logf(SessionLog::Level::Info, "recognition started (%s)", SessionLog::sourceToString(source_));
}

void RecognitionCoordinator::stop()
{
  restart_task_.cancel();
  if (!active_)
  {
    return;
  }
  active_ = false;
  engine_.stop();
  // the engine may report End synchronously
  restart_task_.cancel();
  log_.logf(SessionLog::Level::Info, "recognition stopped (%s)", SessionLog::sourceToString(source_));
}

void RecognitionCoordinator::restart()
{
  if (active_ || restart_task_.isArmed())
  {
    return;
  }
  log_.logf(SessionLog::Level::Debug, "recognition restart in %u ms", static_cast<unsigned>(restart_delay_ms_));
  restart_task_.armAfter(restart_delay_ms_);
}

void RecognitionCoordinator::handleEvent(const RecognitionEvent &event)
{
  switch (event.type)
  {
  case RecognitionEvent::Type::Result:
    // interim hypotheses are dropped
    if (event.is_final && !event.text.empty())
    {
      log_.transcript(source_, event.text);
    }
    break;
  case RecognitionEvent::Type::Error:
    active_ = false;
    if (event.error == RecognitionError::NoSpeech)
    {
      log_.logf(SessionLog::Level::Debug, "recognition: no speech detected");
      restart();
    }
    else
    {
      hard_failed_ = true;
      log_.logf(SessionLog::Level::Error, "recognition error: %s", recognitionErrorToString(event.error));
    }
    break;
  case RecognitionEvent::Type::End:
    active_ = false;
    log_.logf(SessionLog::Level::Debug, "recognition session ended");
    if (!hard_failed_ && keepAlive())
    {
      restart();
    }
    break;
  default:
    break;
  }
}

bool RecognitionCoordinator::keepAlive() const
{
  return keep_alive_ ? keep_alive_() : false;
}

bool RecognitionCoordinator::sessionOpen() const
{
  return session_open_ ? session_open_() : false;
}

void RecognitionCoordinator::onRestartDue()
{
  if (active_ || !sessionOpen())
  {
    return;
  }
  start();
}
