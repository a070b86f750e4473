#pragma once

#include <cstdint>

// Controller state; owned and changed only by ControlLoop
enum class RobotState : uint8_t {
  SCANNING = 0,
  COLLECTING,
  BIN_FULL,
  FAULT,
};

const char* robotStateName(RobotState s);
