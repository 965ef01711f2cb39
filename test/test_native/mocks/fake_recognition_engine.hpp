#pragma once

#include <string>
#include "recognition_engine.hpp"

namespace mocks
{

class FakeRecognitionEngine : public RecognitionEngine
{
public:
  bool start() override
  {
    start_calls++;
    if (refuse_starts > 0)
    {
      refuse_starts--;
      return false;
    }
    running = true;
    return true;
  }

  void stop() override
  {
    stop_calls++;
    running = false;
  }

  void emitResult(const std::string &text, bool isFinal) { dispatch(RecognitionEvent::result(text, isFinal)); }

  void emitError(RecognitionError error)
  {
    running = false;
    dispatch(RecognitionEvent::failure(error));
  }

  void emitEnd()
  {
    running = false;
    dispatch(RecognitionEvent::end());
  }

  int start_calls = 0;
  int stop_calls = 0;
  int refuse_starts = 0;
  bool running = false;
};

} // namespace mocks
