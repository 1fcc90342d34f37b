#include "faketv/process_tree.h"

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>

#include "esp_check.h"
#include "esp_log.h"

extern char** environ;

namespace {
constexpr const char* TAG = "proctree";
constexpr size_t kStatReadBytes = 512;

const char* signalName(int sig) {
  switch (sig) {
    case SIGSTOP:
      return "SIGSTOP";
    case SIGCONT:
      return "SIGCONT";
    case SIGTERM:
      return "SIGTERM";
    case SIGKILL:
      return "SIGKILL";
    default:
      return "signal";
  }
}

bool isPidName(const char* name) {
  if (!name || !name[0]) return false;
  for (const char* p = name; *p; ++p) {
    if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
  }
  return true;
}

// Parent pid from /proc/<pid>/stat. The comm field may contain spaces and
// parentheses, so the fields are parsed after the last ')'.
bool readParentPid(pid_t pid, pid_t* parentOut) {
  char path[64];
  snprintf(path, sizeof(path), "/proc/%d/stat", static_cast<int>(pid));

  int fd = -1;
  do {
    fd = ::open(path, O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (fd < 0) return false;

  char buf[kStatReadBytes];
  ssize_t n = -1;
  do {
    n = ::read(fd, buf, sizeof(buf) - 1);
  } while (n < 0 && errno == EINTR);
  ::close(fd);
  if (n <= 0) return false;
  buf[n] = '\0';

  const char* commEnd = strrchr(buf, ')');
  if (!commEnd) return false;
  char state = 0;
  int parent = 0;
  if (sscanf(commEnd + 1, " %c %d", &state, &parent) != 2) return false;
  *parentOut = static_cast<pid_t>(parent);
  return true;
}

int decodeWaitStatus(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}
}  // namespace

esp_err_t PosixProcessTree::spawn(const std::vector<std::string>& argv, pid_t* pidOut) {
  ESP_RETURN_ON_FALSE(!argv.empty() && pidOut, ESP_ERR_INVALID_ARG, TAG,
                      "spawn needs a command and a pid output");

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const std::string& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  // FreeRTOS task threads run with signals masked; the child has to start
  // with an empty mask and default dispositions or SIGTERM/SIGCONT are lost.
  sigset_t emptyMask;
  sigset_t defaultSignals;
  sigemptyset(&emptyMask);
  sigfillset(&defaultSignals);
  sigdelset(&defaultSignals, SIGKILL);
  sigdelset(&defaultSignals, SIGSTOP);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  posix_spawnattr_setsigmask(&attr, &emptyMask);
  posix_spawnattr_setsigdefault(&attr, &defaultSignals);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF);

  pid_t pid = kNoProcess;
  const int err = posix_spawnp(&pid, args[0], nullptr, &attr, args.data(), environ);
  posix_spawnattr_destroy(&attr);
  if (err != 0) {
    ESP_LOGE(TAG, "Failed to start %s: %s", args[0], strerror(err));
    return ESP_FAIL;
  }

  ESP_LOGI(TAG, "Started %s (pid %d)", args[0], static_cast<int>(pid));
  *pidOut = pid;
  return ESP_OK;
}

bool PosixProcessTree::hasExited(pid_t pid) {
  if (reaped_.count(pid) != 0) return true;

  int status = 0;
  pid_t r = -1;
  do {
    r = waitpid(pid, &status, WNOHANG);
  } while (r < 0 && errno == EINTR);

  if (r == 0) return false;
  if (r == pid) {
    reaped_[pid] = decodeWaitStatus(status);
    return true;
  }
  ESP_LOGW(TAG, "waitpid(%d) failed: %s", static_cast<int>(pid), strerror(errno));
  reaped_[pid] = -1;
  return true;
}

int PosixProcessTree::wait(pid_t pid) {
  auto it = reaped_.find(pid);
  if (it != reaped_.end()) {
    const int code = it->second;
    reaped_.erase(it);
    return code;
  }

  int status = 0;
  pid_t r = -1;
  do {
    r = waitpid(pid, &status, 0);
  } while (r < 0 && errno == EINTR);

  if (r != pid) {
    ESP_LOGW(TAG, "waitpid(%d) failed: %s", static_cast<int>(pid), strerror(errno));
    return -1;
  }
  return decodeWaitStatus(status);
}

void PosixProcessTree::pauseTree(pid_t pid) { signalDescendants(pid, SIGSTOP); }

void PosixProcessTree::resumeTree(pid_t pid) { signalDescendants(pid, SIGCONT); }

void PosixProcessTree::killTree(pid_t pid) {
  signalDescendants(pid, SIGTERM);
  if (isGone(pid)) return;

  ESP_LOGI(TAG, "Sending signal %s to process %d", signalName(SIGKILL), static_cast<int>(pid));
  if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
    ESP_LOGW(TAG, "kill(%d, SIGKILL) failed: %s", static_cast<int>(pid), strerror(errno));
  }
}

std::vector<pid_t> PosixProcessTree::listDescendants(pid_t pid) {
  std::multimap<pid_t, pid_t> children;

  DIR* dir = opendir("/proc");
  if (!dir) {
    ESP_LOGE(TAG, "Cannot open /proc: %s", strerror(errno));
    return {};
  }
  struct dirent* ent = nullptr;
  while ((ent = readdir(dir)) != nullptr) {
    if (!isPidName(ent->d_name)) continue;
    const pid_t child = static_cast<pid_t>(atoi(ent->d_name));
    pid_t parent = 0;
    // The process may exit between readdir and the stat read.
    if (!readParentPid(child, &parent)) continue;
    children.emplace(parent, child);
  }
  closedir(dir);

  std::vector<pid_t> out;
  std::deque<pid_t> pending{pid};
  while (!pending.empty()) {
    const pid_t current = pending.front();
    pending.pop_front();
    const auto range = children.equal_range(current);
    for (auto it = range.first; it != range.second; ++it) {
      out.push_back(it->second);
      pending.push_back(it->second);
    }
  }
  return out;
}

bool PosixProcessTree::processExists(pid_t pid) {
  if (pid <= 0) return false;
  return ::kill(pid, 0) == 0 || errno == EPERM;
}

bool PosixProcessTree::isGone(pid_t pid) const {
  return pid <= 0 || reaped_.count(pid) != 0 || !processExists(pid);
}

void PosixProcessTree::signalDescendants(pid_t pid, int sig) {
  if (isGone(pid)) {
    ESP_LOGW(TAG, "No such process %d", static_cast<int>(pid));
    return;
  }

  for (pid_t child : listDescendants(pid)) {
    ESP_LOGI(TAG, "Sending signal %s to process %d", signalName(sig), static_cast<int>(child));
    if (::kill(child, sig) != 0) {
      if (errno == ESRCH) {
        ESP_LOGD(TAG, "Process %d exited before %s", static_cast<int>(child), signalName(sig));
      } else {
        ESP_LOGW(TAG, "kill(%d, %s) failed: %s", static_cast<int>(child), signalName(sig),
                 strerror(errno));
      }
    }
  }
}
