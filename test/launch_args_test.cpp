#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "faketv/launch_args.h"
#include "temp_dir.h"

namespace {

using Args = std::vector<std::string>;

TEST(LaunchArgsTest, ParsesNulSeparatedCmdline) {
  const std::string raw("faketv_service\0seinfeld\0", 24);
  EXPECT_EQ(parseCmdline(raw), (Args{"faketv_service", "seinfeld"}));
  EXPECT_EQ(parseCmdline(std::string("a\0\0b", 4)), (Args{"a", "", "b"}));
  EXPECT_TRUE(parseCmdline("").empty());
}

TEST(LaunchArgsTest, StartShowIsTheOnlyArgument) {
  EXPECT_EQ(startShowFromArguments({"faketv_service", "frasier"}), "frasier");
  EXPECT_EQ(startShowFromArguments({"faketv_service"}), "");
  EXPECT_EQ(startShowFromArguments({}), "");
  EXPECT_EQ(startShowFromArguments({"faketv_service", "a", "b"}), "");
}

TEST(LaunchArgsTest, ReadsCmdlineFile) {
  TempDir dir;
  const std::string path =
      dir.writeFile("cmdline", std::string("faketv_service\0the office\0", 26));
  EXPECT_EQ(readLaunchArguments(path.c_str()), (Args{"faketv_service", "the office"}));
  EXPECT_TRUE(readLaunchArguments((dir.path() + "/missing").c_str()).empty());
}

TEST(LaunchArgsTest, OwnCmdlineNamesThisProgram) {
  const Args args = readLaunchArguments();
  ASSERT_FALSE(args.empty());
  EXPECT_NE(args[0].find("faketv_tests"), std::string::npos);
}

}  // namespace
