#include "faketv/gesture_classifier.h"

#include "esp_log.h"

namespace {
constexpr const char* TAG = "gesture";
}  // namespace

GestureClassifier::GestureClassifier(QueueHandle_t commands, int64_t startUs)
    : commands_(commands), lastPressUs_(startUs), lastReleaseUs_(startUs) {}

bool GestureClassifier::classifyRelease(int64_t releaseGapUs, int64_t pressGapUs,
                                        TouchCommand* commandOut) {
  if (releaseGapUs < kDoubleClickThresholdUs) {
    *commandOut = TouchCommand::kSkip;
    return true;
  }
  if (pressGapUs > kLongPressThresholdUs) {
    *commandOut = TouchCommand::kChangeShow;
    return true;
  }
  return false;
}

bool GestureClassifier::handleEvent(const TouchEvent& event) {
  bool published = false;
  if (event.edge == TouchEdge::kRelease) {
    const int64_t releaseGapUs = event.timeUs - lastReleaseUs_;
    const int64_t pressGapUs = event.timeUs - lastPressUs_;
    ESP_LOGD(TAG, "release: since last release=%lldus since press=%lldus",
             static_cast<long long>(releaseGapUs), static_cast<long long>(pressGapUs));

    TouchCommand command = TouchCommand::kSkip;
    if (classifyRelease(releaseGapUs, pressGapUs, &command)) {
      published = publish(command);
    }
    lastReleaseUs_ = event.timeUs;
  } else {
    lastPressUs_ = event.timeUs;
  }
  return published;
}

bool GestureClassifier::publish(TouchCommand command) {
  if (!commands_) return false;
  if (xQueueSend(commands_, &command, 0) != pdTRUE) {
    ESP_LOGW(TAG, "Command queue full, dropping %s", touchCommandName(command));
    return false;
  }
  ESP_LOGI(TAG, "Gesture -> %s", touchCommandName(command));
  return true;
}
