/**
 * Channel hand-off tests
 *
 * The bookkeeping the device output uses between scheduled sources and the
 * speaker channel.
 */

#include <unity.h>

#include <functional>
#include <memory>
#include <vector>
#include "channel_queue.hpp"

namespace
{
struct Frame
{
  explicit Frame(int id) : id(id) {}
  int id;
};

using FrameQueue = ChannelQueue<Frame>;
using FramePtr = std::shared_ptr<Frame>;

struct Channel
{
  bool operator()(const FramePtr &frame)
  {
    if (refuse > 0)
    {
      refuse--;
      return false;
    }
    played.push_back(frame->id);
    return true;
  }

  int refuse = 0;
  std::vector<int> played;
};
} // namespace

void test_refused_hand_over_keeps_frame_at_head()
{
  FrameQueue queue(2, 0.03);
  Channel channel;
  channel.refuse = 2;
  queue.push(std::make_shared<Frame>(1), 0.0);
  queue.push(std::make_shared<Frame>(2), 0.0);

  TEST_ASSERT_EQUAL(0, queue.submitDue(0.0, std::ref(channel)));
  TEST_ASSERT_EQUAL(0, queue.submitDue(0.01, std::ref(channel)));
  TEST_ASSERT_EQUAL(2, queue.waiting());
  TEST_ASSERT_EQUAL(0, queue.submitted());

  TEST_ASSERT_EQUAL(2, queue.submitDue(0.02, std::ref(channel)));
  TEST_ASSERT_EQUAL(2, channel.played.size());
  TEST_ASSERT_EQUAL(1, channel.played[0]);
  TEST_ASSERT_EQUAL(2, channel.played[1]);
}

void test_hand_over_waits_for_start_time()
{
  FrameQueue queue(2, 0.03);
  Channel channel;
  queue.push(std::make_shared<Frame>(1), 0.1);

  TEST_ASSERT_EQUAL(0, queue.submitDue(0.05, std::ref(channel)));
  TEST_ASSERT_EQUAL(1, queue.submitDue(0.08, std::ref(channel)));
  TEST_ASSERT_EQUAL(1, queue.current()->id);
}

void test_channel_depth_limits_hand_over()
{
  FrameQueue queue(2, 0.03);
  Channel channel;
  for (int id = 1; id <= 3; ++id)
  {
    queue.push(std::make_shared<Frame>(id), 0.0);
  }

  TEST_ASSERT_EQUAL(2, queue.submitDue(0.0, std::ref(channel)));
  TEST_ASSERT_EQUAL(3, queue.inFlight());

  std::vector<FramePtr> done = queue.reap(1);
  TEST_ASSERT_EQUAL(1, done.size());
  TEST_ASSERT_EQUAL(1, done[0]->id);
  TEST_ASSERT_EQUAL(2, queue.current()->id);

  TEST_ASSERT_EQUAL(1, queue.submitDue(0.0, std::ref(channel)));
  TEST_ASSERT_EQUAL(3, channel.played.back());
  TEST_ASSERT_EQUAL(0, queue.reap(2).size());
}

void run_channel_queue_tests()
{
  RUN_TEST(test_refused_hand_over_keeps_frame_at_head);
  RUN_TEST(test_hand_over_waits_for_start_time);
  RUN_TEST(test_channel_depth_limits_hand_over);
}
