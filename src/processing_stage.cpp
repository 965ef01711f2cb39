#include "processing_stage.hpp"
#include <cmath>
#include <utility>

void ProcessingStage::addHandler(Handler handler)
{
  if (handler)
  {
    handlers_.push_back(std::move(handler));
  }
}

void ProcessingStage::post(const Message &msg)
{
  for (auto &handler : handlers_)
  {
    handler(msg);
  }
}

void LevelMeterStage::process(const float *samples, size_t count)
{
  if (samples == nullptr || count == 0)
  {
    return;
  }

  double sum = 0.0;
  for (size_t i = 0; i < count; ++i)
  {
    sum += static_cast<double>(samples[i]) * samples[i];
  }
  last_level_ = static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
  post(Message{"volume", last_level_});
}
