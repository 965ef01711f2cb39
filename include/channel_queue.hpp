#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

// Sources waiting for a hardware channel that holds at most `depth` buffers.
// A source is handed over once its start time is within `lead` seconds and
// the channel has room. A refused hand-over keeps the source at the head,
// so frames always reach the channel in order.
template <typename Node>
class ChannelQueue
{
public:
  using NodePtr = std::shared_ptr<Node>;
  using Submit = std::function<bool(const NodePtr &node)>;

  ChannelQueue(size_t depth, double lead) : depth_(depth), lead_(lead) {}

  void push(const NodePtr &node, double startTime) { waiting_.push_back(Entry{node, startTime}); }

  // Returns the number of sources handed over.
  size_t submitDue(double now, const Submit &submit)
  {
    size_t handed = 0;
    while (!waiting_.empty() && submitted_.size() < depth_)
    {
      const Entry &head = waiting_.front();
      if (head.start_time > now + lead_)
      {
        break;
      }
      if (!submit(head.node))
      {
        break;
      }
      submitted_.push_back(head.node);
      waiting_.pop_front();
      handed++;
    }
    return handed;
  }

  // `held` is what the channel still holds; older submissions have finished.
  std::vector<NodePtr> reap(size_t held)
  {
    std::vector<NodePtr> done;
    while (submitted_.size() > held)
    {
      done.push_back(submitted_.front());
      submitted_.pop_front();
    }
    return done;
  }

  // the source the channel is playing now, if any
  NodePtr current() const { return submitted_.empty() ? NodePtr() : submitted_.front(); }

  size_t waiting() const { return waiting_.size(); }
  size_t submitted() const { return submitted_.size(); }
  size_t inFlight() const { return waiting_.size() + submitted_.size(); }

  void clear()
  {
    waiting_.clear();
    submitted_.clear();
  }

private:
  struct Entry
  {
    NodePtr node;
    double start_time;
  };

  const size_t depth_;
  const double lead_;
  std::deque<Entry> waiting_;
  std::deque<NodePtr> submitted_;
};
