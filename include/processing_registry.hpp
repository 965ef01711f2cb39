#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include "audio_output.hpp"
#include "processing_stage.hpp"

// Processing stages loaded per output context, by name. A stage is loaded
// once per output; later attachments only add handlers to it.
class ProcessingRegistry
{
public:
  // Returns nullptr when the stage cannot be loaded.
  using Loader = std::function<std::shared_ptr<ProcessingStage>()>;

  // Returns the registered stage, or nullptr if loading failed (nothing is
  // kept in that case).
  std::shared_ptr<ProcessingStage> attach(const AudioOutput &output, const std::string &name,
                                          const Loader &load, ProcessingStage::Handler handler);

  std::shared_ptr<ProcessingStage> find(const AudioOutput &output, const std::string &name) const;

  // Drops every stage registered for the output (e.g. when it is torn down).
  void release(const AudioOutput &output);

private:
  using StageMap = std::map<std::string, std::shared_ptr<ProcessingStage>>;
  std::map<const AudioOutput *, StageMap> stages_;
};
