#pragma once

#include <string>
#include <vector>

#include "esp_err.h"

// Show names are the subdirectories of dataDir, sorted. Hidden entries are
// skipped. ESP_ERR_NOT_FOUND if dataDir cannot be opened.
esp_err_t listShows(const std::string& dataDir, std::vector<std::string>* showsOut);

// Full paths of the .mp4/.mkv files in showDir, sorted.
std::vector<std::string> listVideos(const std::string& showDir);

bool hasVideoSuffix(const char* name);
bool fileExistsPosix(const char* path);
bool dirExistsPosix(const char* path);
std::string joinPath(const std::string& dir, const std::string& name);
