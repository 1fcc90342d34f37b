#include "faketv/screen_power.h"

#include "esp_check.h"
#include "esp_log.h"
#include "faketv/config.h"

namespace {
constexpr const char* TAG = "screen";
constexpr int kBacklightPin = FAKETV_BACKLIGHT_GPIO;
constexpr int kPwmPin = FAKETV_BACKLIGHT_PWM_GPIO;
constexpr const char* kPwmAltFunction = "a5";
}  // namespace

esp_err_t runGpioTool(ProcessTreeController* processes, const std::vector<std::string>& args) {
  ESP_RETURN_ON_FALSE(processes, ESP_ERR_INVALID_ARG, TAG, "no process controller");

  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.emplace_back(FAKETV_GPIO_TOOL);
  argv.insert(argv.end(), args.begin(), args.end());

  pid_t pid = kNoProcess;
  ESP_RETURN_ON_ERROR(processes->spawn(argv, &pid), TAG, "%s not started", FAKETV_GPIO_TOOL);
  const int status = processes->wait(pid);
  ESP_RETURN_ON_FALSE(status == 0, ESP_FAIL, TAG, "%s exited with status %d", FAKETV_GPIO_TOOL,
                      status);
  return ESP_OK;
}

ScreenPower::ScreenPower(SysfsGpio* gpio, ProcessTreeController* processes)
    : gpio_(gpio), processes_(processes) {}

esp_err_t ScreenPower::begin() {
  ESP_RETURN_ON_ERROR(runGpioTool(processes_, {"set", std::to_string(kPwmPin), "ip"}), TAG,
                      "pwm pin setup failed");
  ESP_RETURN_ON_ERROR(gpio_->exportPin(kBacklightPin), TAG, "backlight export failed");
  ESP_RETURN_ON_ERROR(gpio_->setDirection(kBacklightPin, true), TAG,
                      "backlight direction failed");
  return ESP_OK;
}

esp_err_t ScreenPower::turnOn() {
  ESP_LOGI(TAG, "Turning on screen.");
  ESP_RETURN_ON_ERROR(
      runGpioTool(processes_, {"set", std::to_string(kPwmPin), "op", kPwmAltFunction}), TAG,
      "pwm pin to alt function failed");
  ESP_RETURN_ON_ERROR(gpio_->write(kBacklightPin, 1), TAG, "backlight enable failed");
  on_ = true;
  return ESP_OK;
}

esp_err_t ScreenPower::turnOff() {
  ESP_LOGI(TAG, "Turning off screen.");
  ESP_RETURN_ON_ERROR(runGpioTool(processes_, {"set", std::to_string(kPwmPin), "ip"}), TAG,
                      "pwm pin to input failed");
  ESP_RETURN_ON_ERROR(gpio_->write(kBacklightPin, 0), TAG, "backlight disable failed");
  on_ = false;
  return ESP_OK;
}
