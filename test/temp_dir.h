#pragma once

#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

// Scratch directory removed with its contents on destruction.
class TempDir {
 public:
  TempDir() {
    char pattern[] = "/tmp/faketv_test_XXXXXX";
    const char* made = mkdtemp(pattern);
    path_ = made ? made : "";
  }

  ~TempDir() {
    if (!path_.empty()) {
      nftw(path_.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
    }
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }

  std::string makeDir(const std::string& relative) const {
    const std::string full = path_ + "/" + relative;
    mkdir(full.c_str(), 0755);
    return full;
  }

  std::string writeFile(const std::string& relative, const std::string& contents = "") const {
    const std::string full = path_ + "/" + relative;
    FILE* f = fopen(full.c_str(), "w");
    if (f) {
      fwrite(contents.data(), 1, contents.size(), f);
      fclose(f);
    }
    return full;
  }

  std::string readFile(const std::string& relative) const {
    std::string out;
    FILE* f = fopen((path_ + "/" + relative).c_str(), "r");
    if (!f) return out;
    char buf[128];
    size_t n = 0;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    fclose(f);
    return out;
  }

 private:
  std::string path_;

  static int removeEntry(const char* path, const struct stat*, int, struct FTW*) {
    return remove(path);
  }
};
