#pragma once

#include <string>

#include "esp_err.h"
#include "faketv/config.h"
#include "faketv/playback_loop.h"
#include "faketv/show_selector.h"
#include "freertos/FreeRTOS.h"

class ShowLoop {
 public:
  static constexpr TickType_t kDefaultEmptyShowBackoff =
      pdMS_TO_TICKS(FAKETV_EMPTY_SHOW_BACKOFF_MS);

  ShowLoop(std::string dataDir, ShowSelector* selector, PlaybackLoop* playback,
           TickType_t emptyShowBackoff = kDefaultEmptyShowBackoff);

  // One selection: rescan shows, pick one, shuffle its videos and play them.
  // Errors are configuration problems the service cannot recover from.
  esp_err_t runOnce(PlaybackOutcome* outcomeOut = nullptr);

  // Repeats runOnce until it fails and returns that error.
  esp_err_t run();

 private:
  std::string dataDir_;
  ShowSelector* selector_ = nullptr;
  PlaybackLoop* playback_ = nullptr;
  TickType_t emptyShowBackoff_ = kDefaultEmptyShowBackoff;
};
