/**
 * Processing registry tests
 */

#include <unity.h>

#include <functional>
#include <memory>
#include <vector>
#include "processing_registry.hpp"
#include "processing_stage.hpp"
#include "mocks/sim_loop.hpp"
#include "mocks/speaker_rig.hpp"

namespace
{
struct CountingLoader
{
  std::shared_ptr<ProcessingStage> operator()()
  {
    loads++;
    if (fail)
    {
      return nullptr;
    }
    return std::make_shared<LevelMeterStage>();
  }

  int loads = 0;
  bool fail = false;
};
} // namespace

void test_stage_is_loaded_once_per_output()
{
  mocks::SimClock clock;
  mocks::FakeAudioOutput output(clock);
  ProcessingRegistry registry;
  CountingLoader loader;
  int first = 0;
  int second = 0;

  auto a = registry.attach(output, "level-meter", std::ref(loader),
                           [&first](const ProcessingStage::Message &) { first++; });
  auto b = registry.attach(output, "level-meter", std::ref(loader),
                           [&second](const ProcessingStage::Message &) { second++; });

  TEST_ASSERT_EQUAL(1, loader.loads);
  TEST_ASSERT_TRUE(a == b);
  TEST_ASSERT_EQUAL(2, a->handlerCount());

  const float samples[] = {0.25f, -0.25f};
  a->process(samples, 2);
  TEST_ASSERT_EQUAL(1, first);
  TEST_ASSERT_EQUAL(1, second);
}

void test_outputs_get_their_own_stages()
{
  mocks::SimClock clock;
  mocks::FakeAudioOutput left(clock);
  mocks::FakeAudioOutput right(clock);
  ProcessingRegistry registry;
  CountingLoader loader;

  auto a = registry.attach(left, "level-meter", std::ref(loader), nullptr);
  auto b = registry.attach(right, "level-meter", std::ref(loader), nullptr);

  TEST_ASSERT_EQUAL(2, loader.loads);
  TEST_ASSERT_TRUE(a != b);
  TEST_ASSERT_TRUE(registry.find(left, "level-meter") == a);
  TEST_ASSERT_TRUE(registry.find(right, "level-meter") == b);
  TEST_ASSERT_EQUAL(0, a->handlerCount());
}

void test_failed_load_is_not_remembered()
{
  mocks::SimClock clock;
  mocks::FakeAudioOutput output(clock);
  ProcessingRegistry registry;
  CountingLoader loader;
  loader.fail = true;

  TEST_ASSERT_NULL(registry.attach(output, "level-meter", std::ref(loader), nullptr).get());
  TEST_ASSERT_NULL(registry.find(output, "level-meter").get());

  loader.fail = false;
  TEST_ASSERT_NOT_NULL(registry.attach(output, "level-meter", std::ref(loader), nullptr).get());
  TEST_ASSERT_EQUAL(2, loader.loads);
}

void test_release_drops_stages_of_one_output()
{
  mocks::SimClock clock;
  mocks::FakeAudioOutput left(clock);
  mocks::FakeAudioOutput right(clock);
  ProcessingRegistry registry;
  CountingLoader loader;
  registry.attach(left, "level-meter", std::ref(loader), nullptr);
  registry.attach(right, "level-meter", std::ref(loader), nullptr);

  registry.release(left);
  TEST_ASSERT_NULL(registry.find(left, "level-meter").get());
  TEST_ASSERT_NOT_NULL(registry.find(right, "level-meter").get());

  registry.attach(left, "level-meter", std::ref(loader), nullptr);
  TEST_ASSERT_EQUAL(3, loader.loads);
}

void test_speaker_reports_failed_processor()
{
  mocks::SpeakerRig rig;
  bool ok = rig.speaker.addProcessor(
      "level-meter", []() { return std::shared_ptr<ProcessingStage>(); }, nullptr);

  TEST_ASSERT_FALSE(ok);
  TEST_ASSERT_EQUAL(1, rig.log.count(SessionLog::Level::Error));

  // playback still works without it
  std::vector<uint8_t> bytes = mocks::pcmRamp(7680);
  rig.speaker.ingest(bytes.data(), bytes.size());
  TEST_ASSERT_EQUAL(1, rig.loop.output.started.size());
  TEST_ASSERT_NULL(rig.loop.output.started[0]->stage.get());
}

void test_level_meter_reports_rms()
{
  LevelMeterStage meter;
  std::vector<float> seen;
  meter.addHandler([&seen](const ProcessingStage::Message &msg) {
    TEST_ASSERT_EQUAL_STRING("volume", msg.event.c_str());
    seen.push_back(msg.value);
  });

  const float square[] = {0.5f, -0.5f, 0.5f, -0.5f};
  meter.process(square, 4);
  meter.process(nullptr, 0);

  TEST_ASSERT_EQUAL(1, seen.size());
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, seen[0]);
  TEST_ASSERT_FLOAT_WITHIN(1e-6f, 0.5f, meter.lastLevel());
}

void run_processing_registry_tests()
{
  RUN_TEST(test_stage_is_loaded_once_per_output);
  RUN_TEST(test_outputs_get_their_own_stages);
  RUN_TEST(test_failed_load_is_not_remembered);
  RUN_TEST(test_release_drops_stages_of_one_output);
  RUN_TEST(test_speaker_reports_failed_processor);
  RUN_TEST(test_level_meter_reports_rms);
}
