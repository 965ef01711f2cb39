#pragma once

#include <functional>
#include <memory>
#include <utility>
#include "audio_output.hpp"

// Fires the completion callback exactly once per session: after the stream
// has been marked complete, nothing is pending, and the last scheduled source
// has finished playing.
class CompletionTracker
{
public:
  using Callback = std::function<void()>;
  // true while frames or partial samples are still waiting to be scheduled
  using PendingCheck = std::function<bool()>;

  explicit CompletionTracker(PendingCheck hasPending);
  ~CompletionTracker();

  void setOnComplete(Callback cb) { on_complete_ = std::move(cb); }

  // Opens a new session.
  void begin();

  // Arms the end notification of the newest final source and disarms the
  // previous one.
  void trackTail(const std::shared_ptr<SourceNode> &source);

  void markStreamComplete();

  // Fires if every condition holds. Returns true if it fired now.
  bool tryFire();

  // Ends the session early (stop()); fires once if the session was open.
  void abort();

  bool isOpen() const { return open_; }
  bool isStreamComplete() const { return stream_complete_; }
  bool hasTail() const { return static_cast<bool>(tail_); }

private:
  void onTailEnded(const SourceNode *source);
  void disarmTail();
  void fire();

  PendingCheck has_pending_;
  Callback on_complete_;
  std::shared_ptr<SourceNode> tail_;
  bool open_ = false;
  bool stream_complete_ = false;
};
