#include "faketv/show_loop.h"

#include <utility>
#include <vector>

#include "esp_check.h"
#include "esp_log.h"
#include "faketv/show_library.h"
#include "freertos/task.h"

namespace {
constexpr const char* TAG = "shows";
}  // namespace

ShowLoop::ShowLoop(std::string dataDir, ShowSelector* selector, PlaybackLoop* playback,
                   TickType_t emptyShowBackoff)
    : dataDir_(std::move(dataDir)),
      selector_(selector),
      playback_(playback),
      emptyShowBackoff_(emptyShowBackoff) {}

esp_err_t ShowLoop::runOnce(PlaybackOutcome* outcomeOut) {
  std::vector<std::string> shows;
  ESP_RETURN_ON_ERROR(listShows(dataDir_, &shows), TAG, "show scan failed");

  std::string show;
  ESP_RETURN_ON_ERROR(selector_->choose(shows, &show), TAG, "no show to play");
  ESP_LOGI(TAG, "Playing show... %s!", show.c_str());

  std::vector<std::string> videos = listVideos(joinPath(dataDir_, show));
  shufflePlaylist(&videos);

  const PlaybackOutcome outcome = playback_->playVideos(videos);
  if (outcomeOut) *outcomeOut = outcome;

  switch (outcome) {
    case PlaybackOutcome::kSpawnFailed:
      ESP_LOGE(TAG, "Player could not be started for show %s", show.c_str());
      return ESP_FAIL;
    case PlaybackOutcome::kNoVideos:
      // The next pick may land on the same empty show; back off so that case
      // never turns into a busy loop.
      ESP_LOGW(TAG, "Show %s has no playable videos", show.c_str());
      if (emptyShowBackoff_ > 0) vTaskDelay(emptyShowBackoff_);
      break;
    case PlaybackOutcome::kChangeShow:
      ESP_LOGI(TAG, "Leaving show %s", show.c_str());
      break;
    case PlaybackOutcome::kFinished:
      break;
  }
  return ESP_OK;
}

esp_err_t ShowLoop::run() {
  for (;;) {
    const esp_err_t err = runOnce();
    if (err != ESP_OK) return err;
  }
}
