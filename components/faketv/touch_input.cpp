#include "faketv/touch_input.h"

#include <errno.h>
#include <fcntl.h>
#include <linux/input.h>
#include <unistd.h>

#include <cstring>

#include "esp_check.h"
#include "esp_log.h"

namespace {
constexpr const char* TAG = "touch";
constexpr int kKeyRelease = 0;
constexpr int kKeyPress = 1;
}  // namespace

TouchInput::~TouchInput() { close(); }

esp_err_t TouchInput::open(const char* devicePath) {
  ESP_RETURN_ON_FALSE(devicePath, ESP_ERR_INVALID_ARG, TAG, "no device path");
  close();

  int fd = -1;
  do {
    fd = ::open(devicePath, O_RDONLY | O_NONBLOCK | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    ESP_LOGE(TAG, "Cannot open %s: %s", devicePath, strerror(errno));
    return ESP_ERR_NOT_FOUND;
  }
  fd_ = fd;
  ESP_LOGI(TAG, "Reading touch events from %s", devicePath);
  return ESP_OK;
}

void TouchInput::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

esp_err_t TouchInput::readEdges(std::vector<TouchEdge>* edges) {
  ESP_RETURN_ON_FALSE(edges, ESP_ERR_INVALID_ARG, TAG, "no output vector");
  ESP_RETURN_ON_FALSE(fd_ >= 0, ESP_ERR_INVALID_STATE, TAG, "device not open");

  for (;;) {
    struct input_event ev = {};
    const ssize_t n = ::read(fd_, &ev, sizeof(ev));
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) return ESP_OK;
      ESP_LOGE(TAG, "Touch device read failed: %s", strerror(errno));
      return ESP_FAIL;
    }
    if (n == 0) {
      ESP_LOGE(TAG, "Touch device closed");
      return ESP_FAIL;
    }
    if (static_cast<size_t>(n) != sizeof(ev)) {
      ESP_LOGE(TAG, "Short read from touch device (%d bytes)", static_cast<int>(n));
      return ESP_FAIL;
    }
    if (ev.type != EV_KEY) continue;
    if (ev.value == kKeyPress) {
      edges->push_back(TouchEdge::kPress);
    } else if (ev.value == kKeyRelease) {
      edges->push_back(TouchEdge::kRelease);
    }
  }
}
