#pragma once

#include <cstdint>

#include "comms/Messages.h"

/*
  MotorBoard

  Command sink for the low-level motor board. The board owns PWM, the
  stepper pulse train and its own comms watchdog; the controller only sends
  the desired drive and mechanism state.

  Implemented by SerialLink (USB serial JSON) and by test fakes.
*/

enum class ActuatorStatus : uint8_t {
  OK = 0,
  HARDWARE_ABSENT,   // board link was never opened / device missing
  LINK_ERROR,        // write to the board failed
  INTERLOCKED,       // refused locally, conflicting command active (nothing sent)
};

const char* actuatorStatusName(ActuatorStatus status);

class MotorBoard {
public:
  virtual ~MotorBoard() = default;

  virtual bool isConnected() const = 0;

  // Sends one full command frame. Never blocks beyond the serial write timeout.
  virtual ActuatorStatus sendCommand(const DriveCommand& drive,
                                     const MechanismCommand& mech,
                                     uint32_t now_ms) = 0;
};
