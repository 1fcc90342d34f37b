#include "faketv/launch_args.h"

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <cstring>

#include "esp_log.h"

namespace {
constexpr const char* TAG = "args";
}  // namespace

std::vector<std::string> parseCmdline(const std::string& raw) {
  std::vector<std::string> args;
  size_t start = 0;
  while (start < raw.size()) {
    size_t end = raw.find('\0', start);
    if (end == std::string::npos) end = raw.size();
    args.emplace_back(raw, start, end - start);
    start = end + 1;
  }
  return args;
}

std::vector<std::string> readLaunchArguments(const char* cmdlinePath) {
  int fd = -1;
  do {
    fd = ::open(cmdlinePath, O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) {
    ESP_LOGW(TAG, "Cannot open %s: %s", cmdlinePath, strerror(errno));
    return {};
  }

  std::string raw;
  char buf[256];
  for (;;) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    raw.append(buf, static_cast<size_t>(n));
  }
  ::close(fd);
  return parseCmdline(raw);
}

std::string startShowFromArguments(const std::vector<std::string>& args) {
  if (args.size() == 2) return args[1];
  if (args.size() > 2) {
    ESP_LOGW(TAG, "Ignoring %u launch arguments; expected at most one show name",
             static_cast<unsigned>(args.size() - 1));
  }
  return std::string();
}
