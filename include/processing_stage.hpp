#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// Post-processing tap in the output graph. Sources connected to a stage hand
// it their samples when they start playing; the stage reports back through
// its message handlers.
class ProcessingStage
{
public:
  struct Message
  {
    std::string event;
    float value;
  };

  using Handler = std::function<void(const Message &)>;

  virtual ~ProcessingStage() = default;

  virtual void process(const float *samples, size_t count) = 0;

  void addHandler(Handler handler);
  size_t handlerCount() const { return handlers_.size(); }

protected:
  void post(const Message &msg);

private:
  std::vector<Handler> handlers_;
};

// Posts {"volume", rms} for every processed block.
class LevelMeterStage : public ProcessingStage
{
public:
  void process(const float *samples, size_t count) override;

  float lastLevel() const { return last_level_; }

private:
  float last_level_ = 0.0f;
};
