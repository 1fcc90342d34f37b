#include "faketv/show_library.h"

#include <dirent.h>
#include <errno.h>
#include <strings.h>
#include <sys/stat.h>

#include <algorithm>
#include <cstring>

#include "esp_check.h"
#include "esp_log.h"

namespace {
constexpr const char* TAG = "library";
constexpr const char* kVideoSuffixes[] = {".mp4", ".mkv"};
}  // namespace

bool fileExistsPosix(const char* path) {
  struct stat st = {};
  return path && stat(path, &st) == 0 && S_ISREG(st.st_mode);
}

bool dirExistsPosix(const char* path) {
  struct stat st = {};
  return path && stat(path, &st) == 0 && S_ISDIR(st.st_mode);
}

bool hasVideoSuffix(const char* name) {
  if (!name) return false;
  const char* dot = strrchr(name, '.');
  if (!dot) return false;
  for (const char* suffix : kVideoSuffixes) {
    if (strcasecmp(dot, suffix) == 0) return true;
  }
  return false;
}

std::string joinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

esp_err_t listShows(const std::string& dataDir, std::vector<std::string>* showsOut) {
  ESP_RETURN_ON_FALSE(showsOut, ESP_ERR_INVALID_ARG, TAG, "no output vector");
  showsOut->clear();

  DIR* dir = opendir(dataDir.c_str());
  if (!dir) {
    ESP_LOGE(TAG, "Cannot open data directory %s: %s", dataDir.c_str(), strerror(errno));
    return ESP_ERR_NOT_FOUND;
  }
  struct dirent* ent = nullptr;
  while ((ent = readdir(dir)) != nullptr) {
    if (ent->d_name[0] == '.') continue;
    if (!dirExistsPosix(joinPath(dataDir, ent->d_name).c_str())) continue;
    showsOut->emplace_back(ent->d_name);
  }
  closedir(dir);
  std::sort(showsOut->begin(), showsOut->end());
  return ESP_OK;
}

std::vector<std::string> listVideos(const std::string& showDir) {
  std::vector<std::string> out;
  DIR* dir = opendir(showDir.c_str());
  if (!dir) {
    ESP_LOGW(TAG, "Cannot open show directory %s: %s", showDir.c_str(), strerror(errno));
    return out;
  }
  struct dirent* ent = nullptr;
  while ((ent = readdir(dir)) != nullptr) {
    if (ent->d_name[0] == '.') continue;
    if (!hasVideoSuffix(ent->d_name)) continue;
    std::string full = joinPath(showDir, ent->d_name);
    if (!fileExistsPosix(full.c_str())) continue;
    out.push_back(std::move(full));
  }
  closedir(dir);
  std::sort(out.begin(), out.end());
  ESP_LOGI(TAG, "Found %u videos in directory %s", static_cast<unsigned>(out.size()),
           showDir.c_str());
  return out;
}
