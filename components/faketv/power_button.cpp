#include "faketv/power_button.h"

#include <utility>

#include "esp_check.h"
#include "esp_log.h"
#include "freertos/task.h"

namespace {
constexpr const char* TAG = "button";
}  // namespace

PowerButton::PowerButton(SysfsGpio* gpio, int pin, Callback onChange, TickType_t settle)
    : gpio_(gpio), pin_(pin), onChange_(std::move(onChange)), settle_(settle) {}

esp_err_t PowerButton::begin() {
  ESP_RETURN_ON_ERROR(gpio_->exportPin(pin_), TAG, "export of button pin failed");
  ESP_RETURN_ON_ERROR(gpio_->setDirection(pin_, false), TAG, "button pin direction failed");

  int level = 0;
  ESP_RETURN_ON_ERROR(gpio_->read(pin_, &level), TAG, "button read failed");
  lastLevel_ = level;
  ESP_LOGI(TAG, "Button on gpio %d starts at level %d", pin_, level);
  if (onChange_) onChange_(level);
  return ESP_OK;
}

esp_err_t PowerButton::poll() {
  int level = 0;
  ESP_RETURN_ON_ERROR(gpio_->read(pin_, &level), TAG, "button read failed");
  if (level == lastLevel_) return ESP_OK;

  vTaskDelay(settle_);
  ESP_RETURN_ON_ERROR(gpio_->read(pin_, &level), TAG, "button read failed");
  if (level == lastLevel_) {
    ESP_LOGD(TAG, "Bounce on gpio %d ignored", pin_);
    return ESP_OK;
  }

  lastLevel_ = level;
  ESP_LOGI(TAG, "Button on gpio %d -> %d", pin_, level);
  if (onChange_) onChange_(level);
  return ESP_OK;
}
