#include "faketv/show_selector.h"

#include <algorithm>
#include <utility>

#include "esp_check.h"
#include "esp_log.h"

namespace {
constexpr const char* TAG = "selector";

std::string joinNames(const std::vector<std::string>& names) {
  std::string out;
  for (const std::string& name : names) {
    if (!out.empty()) out += ", ";
    out += name;
  }
  return out;
}
}  // namespace

void shufflePlaylist(std::vector<std::string>* videos) {
  if (!videos) return;
  EspRandomEngine engine;
  std::shuffle(videos->begin(), videos->end(), engine);
}

ShowSelector::ShowSelector(std::string startShow) : startShow_(std::move(startShow)) {}

esp_err_t ShowSelector::choose(const std::vector<std::string>& shows, std::string* showOut) {
  ESP_RETURN_ON_FALSE(showOut, ESP_ERR_INVALID_ARG, TAG, "no output string");
  if (shows.empty()) {
    ESP_LOGE(TAG, "No shows available");
    return ESP_ERR_NOT_FOUND;
  }

  if (!startShow_.empty()) {
    if (std::find(shows.begin(), shows.end(), startShow_) == shows.end()) {
      ESP_LOGE(TAG, "Show %s was requested to start playing, but is not one of the available "
                    "shows: %s",
               startShow_.c_str(), joinNames(shows).c_str());
      return ESP_ERR_NOT_FOUND;
    }
    *showOut = startShow_;
    lastShowPlayed_ = startShow_;
    startShow_.clear();
    return ESP_OK;
  }

  std::vector<std::string> candidates;
  candidates.reserve(shows.size());
  for (const std::string& show : shows) {
    if (shows.size() > 1 && show == lastShowPlayed_) continue;
    candidates.push_back(show);
  }

  const size_t idx = static_cast<size_t>(esp_random() % candidates.size());
  *showOut = candidates[idx];
  lastShowPlayed_ = *showOut;
  return ESP_OK;
}
