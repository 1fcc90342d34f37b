#pragma once

#include <string>
#include <vector>

#include "faketv/config.h"
#include "faketv/process_tree.h"
#include "faketv/touch_command.h"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"

enum class PlaybackOutcome {
  kFinished,     // every video ended or was skipped
  kChangeShow,   // a ChangeShow command abandoned the rest of the show
  kNoVideos,     // nothing to play
  kSpawnFailed,  // the player could not be started
};

const char* playbackOutcomeName(PlaybackOutcome outcome);

// Plays one show's videos in the given order. Between polls of the player the
// loop waits on the command queue; any command kills the player tree before
// it takes effect.
class PlaybackLoop {
 public:
  static constexpr TickType_t kDefaultCommandWait = pdMS_TO_TICKS(FAKETV_COMMAND_WAIT_MS);

  PlaybackLoop(ProcessTreeController* processes, QueueHandle_t commands,
               pid_t staticPid = kNoProcess, TickType_t commandWait = kDefaultCommandWait);

  PlaybackOutcome playVideos(const std::vector<std::string>& videos);

  static std::vector<std::string> playerCommand(const std::string& videoPath);

 private:
  ProcessTreeController* processes_ = nullptr;
  QueueHandle_t commands_ = nullptr;
  pid_t staticPid_ = kNoProcess;
  TickType_t commandWait_ = kDefaultCommandWait;

  void pauseStatic();
  void resumeStatic();
};
