#include "session_log.hpp"
#include <cstdarg>
#include <cstdio>

void SessionLog::logf(Level level, const char *fmt, ...)
{
  char buf[192];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buf, sizeof(buf), fmt, args);
  va_end(args);
  write(level, buf);
}

const char *SessionLog::sourceToString(Source source)
{
  switch (source)
  {
  case Source::Local:
    return "Local";
  case Source::Remote:
    return "Remote";
  default:
    return "Unknown";
  }
}
