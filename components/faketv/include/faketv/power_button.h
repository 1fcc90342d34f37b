#pragma once

#include <functional>

#include "esp_err.h"
#include "faketv/config.h"
#include "faketv/gpio_sysfs.h"
#include "freertos/FreeRTOS.h"

// Debounced level watcher for the power switch. A level change is only
// reported after it has held for the settle time; the callback receives the
// settled level.
class PowerButton {
 public:
  using Callback = std::function<void(int level)>;

  static constexpr TickType_t kDefaultSettle = pdMS_TO_TICKS(FAKETV_BUTTON_BOUNCE_MS);

  PowerButton(SysfsGpio* gpio, int pin, Callback onChange, TickType_t settle = kDefaultSettle);

  // Configures the pin as input and reports the current level once.
  esp_err_t begin();

  // Samples the pin once; blocks for the settle time only when it moved.
  esp_err_t poll();

  int level() const { return lastLevel_; }

 private:
  SysfsGpio* gpio_ = nullptr;
  int pin_ = -1;
  Callback onChange_;
  TickType_t settle_ = kDefaultSettle;
  int lastLevel_ = -1;
};
