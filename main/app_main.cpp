#include <stdlib.h>

#include <string>
#include <vector>

#include "esp_err.h"
#include "esp_log.h"
#include "esp_timer.h"

#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include "freertos/task.h"

#include "faketv/config.h"
#include "faketv/gesture_classifier.h"
#include "faketv/gpio_sysfs.h"
#include "faketv/launch_args.h"
#include "faketv/playback_loop.h"
#include "faketv/power_button.h"
#include "faketv/process_tree.h"
#include "faketv/screen_power.h"
#include "faketv/show_library.h"
#include "faketv/show_loop.h"
#include "faketv/show_selector.h"
#include "faketv/touch_command.h"
#include "faketv/touch_input.h"

namespace {
constexpr const char* TAG = "faketv";
constexpr UBaseType_t kCommandQueueDepth = 32;
constexpr uint32_t kTaskStackBytes = 8192;
constexpr UBaseType_t kPlayerTaskPriority = 5;
constexpr UBaseType_t kTouchTaskPriority = 6;
constexpr UBaseType_t kButtonTaskPriority = 4;
constexpr TickType_t kTouchPollTicks = pdMS_TO_TICKS(FAKETV_TOUCH_POLL_MS);
constexpr TickType_t kButtonPollTicks = pdMS_TO_TICKS(FAKETV_BUTTON_POLL_MS);

struct ServiceContext {
  QueueHandle_t commands = nullptr;
  PosixProcessTree processes;  // static video and players; player task only after boot
  pid_t staticPid = kNoProcess;
  std::string startShow;
};

ServiceContext s_service;

// The process supervisor owns restarts, so unrecoverable errors end the
// service with a non-zero status.
void exitWithError(const char* what, esp_err_t err) {
  ESP_LOGE(TAG, "%s: %s", what, esp_err_to_name(err));
  exit(EXIT_FAILURE);
}

// The looping static video is paused while a show plays and resumed when
// playback is interrupted, instead of leaving a blank screen.
pid_t startTvStatic(ProcessTreeController* processes) {
  const std::string path = joinPath(FAKETV_DATA_DIR, FAKETV_STATIC_FILENAME);
  if (!fileExistsPosix(path.c_str())) {
    ESP_LOGI(TAG, "No static video at %s", path.c_str());
    return kNoProcess;
  }

  pid_t pid = kNoProcess;
  const esp_err_t err = processes->spawn({FAKETV_PLAYER_BIN, "--no-osd", "--loop", path}, &pid);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "TV static disabled: %s", esp_err_to_name(err));
    return kNoProcess;
  }
  // Show the static for a moment at boot.
  vTaskDelay(pdMS_TO_TICKS(FAKETV_INITIAL_STATIC_MS));
  return pid;
}

void buttonTask(void*) {
  PosixProcessTree processes;
  SysfsGpio gpio;
  ScreenPower screen(&gpio, &processes);

  esp_err_t err = screen.begin();
  if (err != ESP_OK) exitWithError("Screen power setup failed", err);

  err = runGpioTool(&processes, {"set", std::to_string(FAKETV_BUTTON_GPIO), "ip", "pu"});
  if (err != ESP_OK) exitWithError("Button pull-up setup failed, try running as root", err);

  PowerButton button(&gpio, FAKETV_BUTTON_GPIO, [&screen](int level) {
    const esp_err_t changeErr = level ? screen.turnOn() : screen.turnOff();
    if (changeErr != ESP_OK) {
      ESP_LOGW(TAG, "Screen power change failed: %s", esp_err_to_name(changeErr));
    }
  });
  err = button.begin();
  if (err != ESP_OK) exitWithError("Failed to watch the power button, try running as root", err);

  for (;;) {
    err = button.poll();
    if (err != ESP_OK) {
      ESP_LOGW(TAG, "Button poll failed: %s", esp_err_to_name(err));
    }
    vTaskDelay(kButtonPollTicks);
  }
}

void touchTask(void* arg) {
  auto commands = static_cast<QueueHandle_t>(arg);

  TouchInput touch;
  esp_err_t err = touch.open(FAKETV_TOUCH_DEVICE);
  if (err != ESP_OK) exitWithError("Touch device unavailable", err);

  GestureClassifier classifier(commands, esp_timer_get_time());
  std::vector<TouchEdge> edges;
  for (;;) {
    edges.clear();
    err = touch.readEdges(&edges);
    if (err != ESP_OK) exitWithError("Touch input failed", err);

    const int64_t nowUs = esp_timer_get_time();
    for (TouchEdge edge : edges) {
      classifier.handleEvent(TouchEvent{edge, nowUs});
    }
    vTaskDelay(kTouchPollTicks);
  }
}

void playerTask(void*) {
  ShowSelector selector(s_service.startShow);
  PlaybackLoop playback(&s_service.processes, s_service.commands, s_service.staticPid);
  ShowLoop shows(FAKETV_DATA_DIR, &selector, &playback);

  const esp_err_t err = shows.run();
  exitWithError("Player loop stopped", err);
}

void startTask(TaskFunction_t fn, const char* name, void* arg, UBaseType_t priority) {
  if (xTaskCreate(fn, name, kTaskStackBytes, arg, priority, nullptr) != pdPASS) {
    exitWithError(name, ESP_ERR_NO_MEM);
  }
}
}  // namespace

extern "C" void app_main(void) {
  ESP_LOGI(TAG, "faketv starting, shows in %s", FAKETV_DATA_DIR);

  s_service.startShow = startShowFromArguments(readLaunchArguments());
  if (!s_service.startShow.empty()) {
    ESP_LOGI(TAG, "Requested start show: %s", s_service.startShow.c_str());
  }

  s_service.staticPid = startTvStatic(&s_service.processes);

  startTask(buttonTask, "button_task", nullptr, kButtonTaskPriority);

  s_service.commands = xQueueCreate(kCommandQueueDepth, sizeof(TouchCommand));
  if (!s_service.commands) exitWithError("Command queue alloc failed", ESP_ERR_NO_MEM);

  startTask(playerTask, "player_task", nullptr, kPlayerTaskPriority);
  startTask(touchTask, "touch_task", s_service.commands, kTouchTaskPriority);
}
