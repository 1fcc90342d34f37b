#include "faketv/gpio_sysfs.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstring>
#include <utility>

#include "esp_check.h"
#include "esp_log.h"
#include "faketv/show_library.h"

namespace {
constexpr const char* TAG = "gpio";

esp_err_t writeAttribute(const std::string& path, const std::string& value) {
  int fd = -1;
  do {
    fd = ::open(path.c_str(), O_WRONLY | O_TRUNC | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    ESP_LOGE(TAG, "Cannot open %s: %s", path.c_str(), strerror(errno));
    return ESP_FAIL;
  }
  ssize_t n = -1;
  do {
    n = ::write(fd, value.data(), value.size());
  } while (n < 0 && errno == EINTR);
  const int writeErrno = errno;
  ::close(fd);
  if (n != static_cast<ssize_t>(value.size())) {
    ESP_LOGE(TAG, "Write of '%s' to %s failed: %s", value.c_str(), path.c_str(),
             strerror(writeErrno));
    return ESP_FAIL;
  }
  return ESP_OK;
}
}  // namespace

SysfsGpio::SysfsGpio(std::string root, int base) : root_(std::move(root)), base_(base) {}

std::string SysfsGpio::pinPath(int pin, const char* attribute) const {
  return joinPath(joinPath(root_, "gpio" + std::to_string(base_ + pin)), attribute);
}

esp_err_t SysfsGpio::exportPin(int pin) {
  if (dirExistsPosix(joinPath(root_, "gpio" + std::to_string(base_ + pin)).c_str())) {
    return ESP_OK;
  }
  ESP_RETURN_ON_ERROR(writeAttribute(joinPath(root_, "export"), std::to_string(base_ + pin)), TAG,
                      "export of gpio %d failed", pin);
  return ESP_OK;
}

esp_err_t SysfsGpio::setDirection(int pin, bool output) {
  return writeAttribute(pinPath(pin, "direction"), output ? "out" : "in");
}

esp_err_t SysfsGpio::write(int pin, int level) {
  return writeAttribute(pinPath(pin, "value"), level ? "1" : "0");
}

esp_err_t SysfsGpio::read(int pin, int* levelOut) {
  ESP_RETURN_ON_FALSE(levelOut, ESP_ERR_INVALID_ARG, TAG, "no level output");
  const std::string path = pinPath(pin, "value");

  int fd = -1;
  do {
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    ESP_LOGE(TAG, "Cannot open %s: %s", path.c_str(), strerror(errno));
    return ESP_FAIL;
  }
  char c = 0;
  ssize_t n = -1;
  do {
    n = ::read(fd, &c, 1);
  } while (n < 0 && errno == EINTR);
  ::close(fd);
  ESP_RETURN_ON_FALSE(n == 1 && (c == '0' || c == '1'), ESP_FAIL, TAG,
                      "unexpected value in %s", path.c_str());
  *levelOut = (c == '1') ? 1 : 0;
  return ESP_OK;
}
