#pragma once

// Build-time defaults. Each value can be overridden with a compile definition.

#ifndef FAKETV_DATA_DIR
#define FAKETV_DATA_DIR "/opt/faketv/data"
#endif

#ifndef FAKETV_STATIC_FILENAME
#define FAKETV_STATIC_FILENAME "tv_static.mp4"
#endif

#ifndef FAKETV_TOUCH_DEVICE
#define FAKETV_TOUCH_DEVICE "/dev/input/event0"
#endif

#ifndef FAKETV_PLAYER_BIN
#define FAKETV_PLAYER_BIN "omxplayer"
#endif

#ifndef FAKETV_GPIO_TOOL
#define FAKETV_GPIO_TOOL "raspi-gpio"
#endif

#ifndef FAKETV_GPIO_SYSFS_ROOT
#define FAKETV_GPIO_SYSFS_ROOT "/sys/class/gpio"
#endif

// Newer kernels register the SoC gpiochip at an offset (e.g. 512).
#ifndef FAKETV_GPIO_SYSFS_BASE
#define FAKETV_GPIO_SYSFS_BASE 0
#endif

#ifndef FAKETV_BUTTON_GPIO
#define FAKETV_BUTTON_GPIO 26
#endif

#ifndef FAKETV_BACKLIGHT_GPIO
#define FAKETV_BACKLIGHT_GPIO 18
#endif

#ifndef FAKETV_BACKLIGHT_PWM_GPIO
#define FAKETV_BACKLIGHT_PWM_GPIO 19
#endif

#ifndef FAKETV_BUTTON_BOUNCE_MS
#define FAKETV_BUTTON_BOUNCE_MS 100
#endif

#ifndef FAKETV_BUTTON_POLL_MS
#define FAKETV_BUTTON_POLL_MS 20
#endif

#ifndef FAKETV_TOUCH_POLL_MS
#define FAKETV_TOUCH_POLL_MS 10
#endif

#ifndef FAKETV_DOUBLE_CLICK_THRESHOLD_MS
#define FAKETV_DOUBLE_CLICK_THRESHOLD_MS 200
#endif

#ifndef FAKETV_LONG_PRESS_THRESHOLD_MS
#define FAKETV_LONG_PRESS_THRESHOLD_MS 2000
#endif

#ifndef FAKETV_COMMAND_WAIT_MS
#define FAKETV_COMMAND_WAIT_MS 1000
#endif

#ifndef FAKETV_INITIAL_STATIC_MS
#define FAKETV_INITIAL_STATIC_MS 1500
#endif

#ifndef FAKETV_EMPTY_SHOW_BACKOFF_MS
#define FAKETV_EMPTY_SHOW_BACKOFF_MS 1000
#endif
