#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fake_process_tree.h"
#include "faketv/config.h"
#include "faketv/screen_power.h"
#include "temp_dir.h"

namespace {

class ScreenPowerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    backlight_ = "gpio" + std::to_string(FAKETV_BACKLIGHT_GPIO);
    sysfs_.makeDir(backlight_);
    sysfs_.writeFile(backlight_ + "/direction", "in");
    sysfs_.writeFile(backlight_ + "/value", "0");
  }

  std::vector<std::string> tool(std::vector<std::string> args) const {
    args.insert(args.begin(), FAKETV_GPIO_TOOL);
    return args;
  }

  TempDir sysfs_;
  std::string backlight_;
  FakeProcessTree tree_;
};

TEST_F(ScreenPowerTest, BeginParksPwmAndDrivesBacklightPin) {
  SysfsGpio gpio(sysfs_.path());
  ScreenPower screen(&gpio, &tree_);

  ASSERT_EQ(screen.begin(), ESP_OK);
  ASSERT_EQ(tree_.spawned.size(), 1u);
  EXPECT_EQ(tree_.spawned[0], tool({"set", "19", "ip"}));
  EXPECT_EQ(sysfs_.readFile(backlight_ + "/direction"), "out");
  EXPECT_FALSE(screen.isOn());
}

TEST_F(ScreenPowerTest, TurnOnAndOff) {
  SysfsGpio gpio(sysfs_.path());
  ScreenPower screen(&gpio, &tree_);
  ASSERT_EQ(screen.begin(), ESP_OK);

  ASSERT_EQ(screen.turnOn(), ESP_OK);
  EXPECT_TRUE(screen.isOn());
  EXPECT_EQ(tree_.spawned.back(), tool({"set", "19", "op", "a5"}));
  EXPECT_EQ(sysfs_.readFile(backlight_ + "/value"), "1");

  ASSERT_EQ(screen.turnOff(), ESP_OK);
  EXPECT_FALSE(screen.isOn());
  EXPECT_EQ(tree_.spawned.back(), tool({"set", "19", "ip"}));
  EXPECT_EQ(sysfs_.readFile(backlight_ + "/value"), "0");

  // Every tool run is reaped.
  EXPECT_EQ(tree_.count("wait"), tree_.spawned.size());
}

TEST_F(ScreenPowerTest, ExportsMissingPin) {
  TempDir bare;
  bare.writeFile("export");
  SysfsGpio gpio(bare.path());
  ASSERT_EQ(gpio.exportPin(FAKETV_BACKLIGHT_GPIO), ESP_OK);
  EXPECT_EQ(bare.readFile("export"), std::to_string(FAKETV_BACKLIGHT_GPIO));
}

TEST_F(ScreenPowerTest, GpioToolFailureIsReported) {
  SysfsGpio gpio(sysfs_.path());
  ScreenPower screen(&gpio, &tree_);
  tree_.exitStatus = 1;
  EXPECT_EQ(screen.turnOn(), ESP_FAIL);
  EXPECT_FALSE(screen.isOn());

  tree_.exitStatus = 0;
  tree_.failSpawn = true;
  EXPECT_EQ(runGpioTool(&tree_, {"get", "19"}), ESP_FAIL);
}

TEST_F(ScreenPowerTest, MissingBacklightPinFailsTurnOn) {
  TempDir empty;
  SysfsGpio gpio(empty.path());
  ScreenPower screen(&gpio, &tree_);
  EXPECT_NE(screen.turnOn(), ESP_OK);
  EXPECT_FALSE(screen.isOn());
}

}  // namespace
