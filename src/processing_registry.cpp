#include "processing_registry.hpp"
#include <utility>

std::shared_ptr<ProcessingStage> ProcessingRegistry::attach(const AudioOutput &output, const std::string &name,
                                                            const Loader &load, ProcessingStage::Handler handler)
{
  StageMap &stages = stages_[&output];
  auto it = stages.find(name);
  if (it != stages.end())
  {
    it->second->addHandler(std::move(handler));
    return it->second;
  }

  std::shared_ptr<ProcessingStage> stage = load ? load() : nullptr;
  if (!stage)
  {
    if (stages.empty())
    {
      stages_.erase(&output);
    }
    return nullptr;
  }

  stage->addHandler(std::move(handler));
  stages.emplace(name, stage);
  return stage;
}

std::shared_ptr<ProcessingStage> ProcessingRegistry::find(const AudioOutput &output, const std::string &name) const
{
  auto out = stages_.find(&output);
  if (out == stages_.end())
  {
    return nullptr;
  }
  auto it = out->second.find(name);
  return it == out->second.end() ? nullptr : it->second;
}

void ProcessingRegistry::release(const AudioOutput &output)
{
  stages_.erase(&output);
}
