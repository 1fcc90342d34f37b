#pragma once

#include <sys/types.h>

#include <map>
#include <string>
#include <vector>

#include "esp_err.h"

constexpr pid_t kNoProcess = -1;

// Spawns external players and signals their whole process tree. The player
// does its real work in children it forks after start-up, so every tree
// operation re-enumerates the descendants at call time.
class ProcessTreeController {
 public:
  virtual ~ProcessTreeController() = default;

  virtual esp_err_t spawn(const std::vector<std::string>& argv, pid_t* pidOut) = 0;

  // Non-blocking completion check.
  virtual bool hasExited(pid_t pid) = 0;

  // Blocks until pid exits and reaps it. Returns the exit code, 128 + signal
  // for a signalled process, or -1 if pid is not a child.
  virtual int wait(pid_t pid) = 0;

  // SIGSTOP / SIGCONT to every descendant of pid. A vanished pid is logged and
  // otherwise ignored.
  virtual void pauseTree(pid_t pid) = 0;
  virtual void resumeTree(pid_t pid) = 0;

  // SIGTERM to every descendant, then SIGKILL to pid itself.
  virtual void killTree(pid_t pid) = 0;
};

class PosixProcessTree : public ProcessTreeController {
 public:
  esp_err_t spawn(const std::vector<std::string>& argv, pid_t* pidOut) override;
  bool hasExited(pid_t pid) override;
  int wait(pid_t pid) override;
  void pauseTree(pid_t pid) override;
  void resumeTree(pid_t pid) override;
  void killTree(pid_t pid) override;

  // Descendants of pid found by walking parent links in /proc, breadth first.
  static std::vector<pid_t> listDescendants(pid_t pid);
  static bool processExists(pid_t pid);

 private:
  std::map<pid_t, int> reaped_;

  bool isGone(pid_t pid) const;
  void signalDescendants(pid_t pid, int sig);
};
