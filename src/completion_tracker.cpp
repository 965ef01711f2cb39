#include "completion_tracker.hpp"
#include <utility>

CompletionTracker::CompletionTracker(PendingCheck hasPending)
    : has_pending_(std::move(hasPending))
{
}

CompletionTracker::~CompletionTracker()
{
  disarmTail();
}

void CompletionTracker::begin()
{
  disarmTail();
  open_ = true;
  stream_complete_ = false;
}

void CompletionTracker::trackTail(const std::shared_ptr<SourceNode> &source)
{
  disarmTail();
  if (!source)
  {
    return;
  }

  tail_ = source;
  const SourceNode *raw = source.get();
  source->setOnEnded([this, raw]() { onTailEnded(raw); });
}

void CompletionTracker::markStreamComplete()
{
  stream_complete_ = true;
}

bool CompletionTracker::tryFire()
{
  if (!open_ || !stream_complete_ || tail_)
  {
    return false;
  }
  if (has_pending_ && has_pending_())
  {
    return false;
  }
  fire();
  return true;
}

void CompletionTracker::abort()
{
  disarmTail();
  if (open_)
  {
    fire();
  }
}

void CompletionTracker::onTailEnded(const SourceNode *source)
{
  if (tail_.get() != source)
  {
    return;
  }
  // the output still holds the node while this runs
  tail_.reset();
  tryFire();
}

void CompletionTracker::disarmTail()
{
  if (tail_)
  {
    tail_->setOnEnded(nullptr);
    tail_.reset();
  }
}

void CompletionTracker::fire()
{
  open_ = false;
  if (on_complete_)
  {
    on_complete_();
  }
}
