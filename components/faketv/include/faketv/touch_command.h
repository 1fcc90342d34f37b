#pragma once

#include <stdint.h>

enum class TouchCommand : uint8_t {
  kSkip = 1,
  kChangeShow = 2,
};

inline const char* touchCommandName(TouchCommand command) {
  switch (command) {
    case TouchCommand::kSkip:
      return "SKIP";
    case TouchCommand::kChangeShow:
      return "CHANGE_SHOW";
  }
  return "UNKNOWN";
}
