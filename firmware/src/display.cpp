#include "display.hpp"
#include <algorithm>

namespace
{
constexpr int32_t kEyeY = 102;
constexpr int32_t kBetweenEyes = 135;
constexpr int32_t kEyeSize = 8;
constexpr int32_t kMouthY = 157;
constexpr int32_t kMouthWidth = 85;
constexpr int32_t kMouthMinHeight = 4;
constexpr int32_t kMouthMaxHeight = 40;
} // namespace

Display::Display(StateMachine &stateMachine) : state_(stateMachine) {}

void Display::init()
{
  M5.Display.clear();
  M5.Display.setTextSize(2);
  drawForState(state_.getState());
  has_prev_state_ = true;
  prev_state_ = state_.getState();
}

void Display::loop()
{
  StateMachine::State current = state_.getState();
  if (!has_prev_state_ || current != prev_state_)
  {
    drawForState(current);
  }

  prev_state_ = current;
  has_prev_state_ = true;

  if (!state_.isActive())
  {
    volume_ = 0.0f;
  }
  drawMouth();
}

void Display::transcript(Source source, const std::string &text)
{
  log_i("[%s] %s", SessionLog::sourceToString(source), text.c_str());
  M5.Display.setCursor(10, 200);
  M5.Display.setTextColor(TFT_WHITE, colorForState(state_.getState()));
  M5.Display.printf("%s: %s\n", SessionLog::sourceToString(source), text.c_str());
}

void Display::write(Level level, const char *message)
{
  switch (level)
  {
  case Level::Debug:
    log_d("%s", message);
    break;
  case Level::Info:
    log_i("%s", message);
    break;
  case Level::Warn:
    log_w("%s", message);
    break;
  case Level::Error:
    log_e("%s", message);
    break;
  }
}

void Display::drawForState(StateMachine::State state)
{
  uint16_t bg = colorForState(state);
  M5.Display.fillScreen(bg);

  M5.Display.fillCircle(160 - kBetweenEyes / 2, kEyeY, kEyeSize, TFT_WHITE);
  M5.Display.fillCircle(160 + kBetweenEyes / 2, kEyeY, kEyeSize, TFT_WHITE);
  mouth_height_ = -1;
  drawMouth();
}

void Display::drawMouth()
{
  const float v = std::min(1.0f, std::max(0.0f, volume_ * 2.0f));
  const int32_t height = kMouthMinHeight + static_cast<int32_t>(v * (kMouthMaxHeight - kMouthMinHeight));
  if (height == mouth_height_)
  {
    return;
  }

  const uint16_t bg = colorForState(state_.getState());
  M5.Display.fillRect(160 - kMouthWidth / 2, kMouthY - kMouthMaxHeight / 2, kMouthWidth, kMouthMaxHeight, bg);
  M5.Display.fillRect(160 - kMouthWidth / 2, kMouthY - height / 2, kMouthWidth, height, TFT_WHITE);
  mouth_height_ = height;
}

uint16_t Display::colorForState(StateMachine::State state)
{
  switch (state)
  {
  case StateMachine::Idle:
    return TFT_BLACK;
  case StateMachine::Playing:
    return TFT_GREEN;
  case StateMachine::Draining:
    return TFT_DARKGREEN;
  case StateMachine::Stopped:
    return TFT_BLUE;
  default:
    return TFT_DARKGREY;
  }
}
