#pragma once

#include <string>
#include <vector>

#include "esp_err.h"
#include "faketv/gpio_sysfs.h"
#include "faketv/process_tree.h"

// Runs the board GPIO tool (raspi-gpio) with args and waits for it.
esp_err_t runGpioTool(ProcessTreeController* processes, const std::vector<std::string>& args);

// Backlight control. On: PWM pin to its alternate function and the enable pin
// high. Off: PWM pin back to input and the enable pin low.
class ScreenPower {
 public:
  ScreenPower(SysfsGpio* gpio, ProcessTreeController* processes);

  esp_err_t begin();
  esp_err_t turnOn();
  esp_err_t turnOff();
  bool isOn() const { return on_; }

 private:
  SysfsGpio* gpio_ = nullptr;
  ProcessTreeController* processes_ = nullptr;
  bool on_ = false;
};
