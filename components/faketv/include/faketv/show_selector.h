#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "esp_err.h"
#include "esp_random.h"

// esp_random() as a UniformRandomBitGenerator for <algorithm>.
struct EspRandomEngine {
  using result_type = uint32_t;
  static constexpr result_type min() { return 0; }
  static constexpr result_type max() { return UINT32_MAX; }
  result_type operator()() { return esp_random(); }
};

void shufflePlaylist(std::vector<std::string>* videos);

class ShowSelector {
 public:
  // startShow, when not empty, is played first and only once.
  explicit ShowSelector(std::string startShow = std::string());

  // Picks the next show from the given names. The requested start show must
  // be present (ESP_ERR_NOT_FOUND otherwise). After that the previous show is
  // excluded whenever another one exists.
  esp_err_t choose(const std::vector<std::string>& shows, std::string* showOut);

  const std::string& lastShowPlayed() const { return lastShowPlayed_; }
  bool startShowPending() const { return !startShow_.empty(); }

 private:
  std::string startShow_;
  std::string lastShowPlayed_;
};
