#pragma once

#include <vector>

#include "esp_err.h"
#include "faketv/gesture_classifier.h"

// Non-blocking reader for an evdev touchscreen. Only EV_KEY press and release
// edges are reported; autorepeat and all other event types are dropped.
class TouchInput {
 public:
  TouchInput() = default;
  ~TouchInput();

  TouchInput(const TouchInput&) = delete;
  TouchInput& operator=(const TouchInput&) = delete;

  esp_err_t open(const char* devicePath);
  void close();
  bool isOpen() const { return fd_ >= 0; }

  // Appends every edge currently pending on the device. ESP_FAIL means the
  // device went away and the stream cannot continue.
  esp_err_t readEdges(std::vector<TouchEdge>* edges);

 private:
  int fd_ = -1;
};
