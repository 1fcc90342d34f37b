#pragma once

#include <stdint.h>

#include "faketv/config.h"
#include "faketv/touch_command.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

enum class TouchEdge : uint8_t {
  kRelease = 0,
  kPress = 1,
};

struct TouchEvent {
  TouchEdge edge = TouchEdge::kRelease;
  int64_t timeUs = 0;
};

// Turns raw press/release edges into Skip (double click) and ChangeShow
// (long press) commands and posts them to the command queue.
class GestureClassifier {
 public:
  static constexpr int64_t kDoubleClickThresholdUs =
      static_cast<int64_t>(FAKETV_DOUBLE_CLICK_THRESHOLD_MS) * 1000;
  static constexpr int64_t kLongPressThresholdUs =
      static_cast<int64_t>(FAKETV_LONG_PRESS_THRESHOLD_MS) * 1000;

  // Both edge timestamps start at startUs so nothing fires before the first
  // real press.
  GestureClassifier(QueueHandle_t commands, int64_t startUs);

  // Returns true when a command was posted for this event.
  bool handleEvent(const TouchEvent& event);

  // Double click wins over long press when both would match.
  static bool classifyRelease(int64_t releaseGapUs, int64_t pressGapUs,
                              TouchCommand* commandOut);

  int64_t lastPressUs() const { return lastPressUs_; }
  int64_t lastReleaseUs() const { return lastReleaseUs_; }

 private:
  QueueHandle_t commands_ = nullptr;
  int64_t lastPressUs_ = 0;
  int64_t lastReleaseUs_ = 0;

  bool publish(TouchCommand command);
};
