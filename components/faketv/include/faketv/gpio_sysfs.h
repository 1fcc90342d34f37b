#pragma once

#include <string>

#include "esp_err.h"
#include "faketv/config.h"

// Pin access through the sysfs GPIO class. Pins are BCM numbers; base is added
// to reach the kernel's gpiochip numbering.
class SysfsGpio {
 public:
  explicit SysfsGpio(std::string root = FAKETV_GPIO_SYSFS_ROOT, int base = FAKETV_GPIO_SYSFS_BASE);

  esp_err_t exportPin(int pin);
  esp_err_t setDirection(int pin, bool output);
  esp_err_t write(int pin, int level);
  esp_err_t read(int pin, int* levelOut);

 private:
  std::string root_;
  int base_ = 0;

  std::string pinPath(int pin, const char* attribute) const;
};
