#include "faketv/playback_loop.h"

#include "esp_log.h"

namespace {
constexpr const char* TAG = "playback";
}  // namespace

const char* playbackOutcomeName(PlaybackOutcome outcome) {
  switch (outcome) {
    case PlaybackOutcome::kFinished:
      return "finished";
    case PlaybackOutcome::kChangeShow:
      return "change_show";
    case PlaybackOutcome::kNoVideos:
      return "no_videos";
    case PlaybackOutcome::kSpawnFailed:
      return "spawn_failed";
  }
  return "unknown";
}

PlaybackLoop::PlaybackLoop(ProcessTreeController* processes, QueueHandle_t commands,
                           pid_t staticPid, TickType_t commandWait)
    : processes_(processes),
      commands_(commands),
      staticPid_(staticPid),
      commandWait_(commandWait) {}

std::vector<std::string> PlaybackLoop::playerCommand(const std::string& videoPath) {
  return {FAKETV_PLAYER_BIN, "--no-osd", "--aspect-mode", "fill", videoPath};
}

PlaybackOutcome PlaybackLoop::playVideos(const std::vector<std::string>& videos) {
  if (videos.empty()) {
    ESP_LOGW(TAG, "Nothing to play");
    return PlaybackOutcome::kNoVideos;
  }

  for (const std::string& video : videos) {
    ESP_LOGI(TAG, "Playing video %s", video.c_str());
    pauseStatic();

    pid_t player = kNoProcess;
    const esp_err_t err = processes_->spawn(playerCommand(video), &player);
    if (err != ESP_OK) {
      ESP_LOGE(TAG, "Player start failed for %s: %s", video.c_str(), esp_err_to_name(err));
      resumeStatic();
      return PlaybackOutcome::kSpawnFailed;
    }

    bool interrupted = false;
    TouchCommand command = TouchCommand::kSkip;
    while (!processes_->hasExited(player)) {
      if (xQueueReceive(commands_, &command, commandWait_) != pdTRUE) continue;

      ESP_LOGI(TAG, "Received a %s", touchCommandName(command));
      // The player decodes in a child process, so the whole tree has to go.
      resumeStatic();
      processes_->killTree(player);
      interrupted = true;
      break;
    }

    const int status = processes_->wait(player);
    ESP_LOGD(TAG, "Player %d finished with status %d", static_cast<int>(player), status);

    if (interrupted && command == TouchCommand::kChangeShow) {
      return PlaybackOutcome::kChangeShow;
    }
  }
  return PlaybackOutcome::kFinished;
}

void PlaybackLoop::pauseStatic() {
  if (staticPid_ != kNoProcess) processes_->pauseTree(staticPid_);
}

void PlaybackLoop::resumeStatic() {
  if (staticPid_ != kNoProcess) processes_->resumeTree(staticPid_);
}
