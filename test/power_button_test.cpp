#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "faketv/power_button.h"
#include "temp_dir.h"

namespace {

constexpr int kPin = 26;

class PowerButtonTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sysfs_.makeDir("gpio26");
    sysfs_.writeFile("gpio26/direction", "out");
    setLevel(1);
  }

  void setLevel(int level) { sysfs_.writeFile("gpio26/value", level ? "1\n" : "0\n"); }

  PowerButton makeButton(TickType_t settle = 0) {
    return PowerButton(&gpio_, kPin, [this](int level) { reported_.push_back(level); }, settle);
  }

  TempDir sysfs_;
  SysfsGpio gpio_{sysfs_.path()};
  std::vector<int> reported_;
};

TEST_F(PowerButtonTest, BeginReportsInitialLevel) {
  PowerButton button = makeButton();
  ASSERT_EQ(button.begin(), ESP_OK);
  EXPECT_EQ(sysfs_.readFile("gpio26/direction"), "in");
  EXPECT_EQ(reported_, std::vector<int>{1});
  EXPECT_EQ(button.level(), 1);
}

TEST_F(PowerButtonTest, SteadyLevelReportsNothing) {
  PowerButton button = makeButton();
  ASSERT_EQ(button.begin(), ESP_OK);
  for (int i = 0; i < 5; ++i) ASSERT_EQ(button.poll(), ESP_OK);
  EXPECT_EQ(reported_, std::vector<int>{1});
}

TEST_F(PowerButtonTest, HeldChangeIsReportedOnce) {
  PowerButton button = makeButton(pdMS_TO_TICKS(5));
  ASSERT_EQ(button.begin(), ESP_OK);

  setLevel(0);
  ASSERT_EQ(button.poll(), ESP_OK);
  ASSERT_EQ(button.poll(), ESP_OK);
  setLevel(1);
  ASSERT_EQ(button.poll(), ESP_OK);

  EXPECT_EQ(reported_, (std::vector<int>{1, 0, 1}));
  EXPECT_EQ(button.level(), 1);
}

TEST_F(PowerButtonTest, UnreadablePinFails) {
  PowerButton button = makeButton();
  ASSERT_EQ(button.begin(), ESP_OK);
  sysfs_.writeFile("gpio26/value", "x");
  EXPECT_EQ(button.poll(), ESP_FAIL);
  EXPECT_EQ(reported_, std::vector<int>{1});
}

TEST_F(PowerButtonTest, MissingPinFailsBegin) {
  TempDir empty;
  SysfsGpio gpio(empty.path());
  PowerButton button(&gpio, kPin, nullptr);
  EXPECT_NE(button.begin(), ESP_OK);
}

}  // namespace
