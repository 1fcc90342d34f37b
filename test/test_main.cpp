#include <gtest/gtest.h>

#include <stdlib.h>

#include <string>
#include <vector>

#include "faketv/launch_args.h"

// The IDF linux port owns main() and runs app_main inside a FreeRTOS task, so
// queue waits and vTaskDelay work in every test.
extern "C" void app_main(void) {
  std::vector<std::string> args = readLaunchArguments();
  if (args.empty()) args.emplace_back("faketv_tests");

  std::vector<char*> argv;
  for (std::string& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);
  int argc = static_cast<int>(args.size());

  ::testing::InitGoogleTest(&argc, argv.data());
  exit(RUN_ALL_TESTS());
}
