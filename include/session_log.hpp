#pragma once

#include <cstdint>
#include <string>

// Logging collaborator for the playback core. Finalized transcripts and
// diagnostics both end up here; the firmware routes them to log_x and the
// display.
class SessionLog
{
public:
  enum class Source : uint8_t
  {
    Local,  // microphone side
    Remote, // reply audio from the server
  };

  enum class Level : uint8_t
  {
    Debug,
    Info,
    Warn,
    Error,
  };

  virtual ~SessionLog() = default;

  virtual void transcript(Source source, const std::string &text) = 0;
  virtual void write(Level level, const char *message) = 0;

  void logf(Level level, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

  static const char *sourceToString(Source source);
};
