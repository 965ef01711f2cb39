#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

enum class RecognitionError : uint8_t
{
  None = 0,
  NoSpeech,     // session timed out without hearing anything
  Aborted,
  AudioCapture,
  NotAllowed,
  Other,
};

struct RecognitionEvent
{
  enum class Type : uint8_t
  {
    Result,
    Error,
    End,
  };

  Type type;
  std::string text;
  bool is_final;
  RecognitionError error;

  static RecognitionEvent result(const std::string &text, bool isFinal)
  {
    return RecognitionEvent{Type::Result, text, isFinal, RecognitionError::None};
  }
  static RecognitionEvent failure(RecognitionError error)
  {
    return RecognitionEvent{Type::Error, std::string(), false, error};
  }
  static RecognitionEvent end()
  {
    return RecognitionEvent{Type::End, std::string(), false, RecognitionError::None};
  }
};

const char *recognitionErrorToString(RecognitionError error);

// External always-listening recognizer. It may stop on its own (silence,
// errors); every stop is reported as an End event.
class RecognitionEngine
{
public:
  using EventHandler = std::function<void(const RecognitionEvent &)>;

  virtual ~RecognitionEngine() = default;

  // false if the engine refused to start
  virtual bool start() = 0;
  // safe when already stopped
  virtual void stop() = 0;

  void setEventHandler(EventHandler handler) { handler_ = std::move(handler); }

protected:
  void dispatch(const RecognitionEvent &event)
  {
    if (handler_)
    {
      handler_(event);
    }
  }

private:
  EventHandler handler_;
};
