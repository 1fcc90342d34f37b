#pragma once

#include <string>
#include <vector>

// The IDF linux entry point does not hand argv to app_main, so the launch
// arguments are read back from procfs.
std::vector<std::string> readLaunchArguments(const char* cmdlinePath = "/proc/self/cmdline");

// Splits a NUL separated command line.
std::vector<std::string> parseCmdline(const std::string& raw);

// The optional starting show: the single argument after the program name.
std::string startShowFromArguments(const std::vector<std::string>& args);
