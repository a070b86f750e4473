#pragma once

#include <cstdint>

#include "actuators/MotorBoard.h"
#include "utils/Clock.h"

/*
===============================================================================
  ActuatorDriver.h
===============================================================================

  PURPOSE
  -------
  Commanded-state wrapper for the paddle motors and the collection conveyor.

  Responsibilities:
    - Keep the commanded drive + collector state
    - Send a full command frame to the MotorBoard only when that state changes
    - Enforce mutual exclusion between propulsion and collection
    - Provide stopAll(), which always transmits and never throws

  Notes:
    - Speeds are signed percent, clamped to [-100, 100]
    - This class does NOT enforce timing (holds live in the ControlLoop)
    - A failed send leaves the commanded state unchanged and marks it
      unconfirmed: until a frame is accepted again, every command is
      transmitted even if it matches the commanded state
===============================================================================
*/

class ActuatorDriver {
public:
  ActuatorDriver(MotorBoard& board, const Clock& clock);

  ActuatorStatus setPropulsion(int left_pct, int right_pct);
  ActuatorStatus stopPropulsion();

  // Stops propulsion first if it is moving.
  ActuatorStatus startCollectionMechanism();
  ActuatorStatus stopCollectionMechanism();

  // Always sends an all-stop frame. Commanded state becomes all-stopped
  // whatever the outcome; a failure is logged and leaves the state
  // unconfirmed (see stateConfirmed()).
  void stopAll() noexcept;

  // Debug/introspection
  const DriveCommand& driveCmd() const { return _drive; }
  bool collectorRunning() const { return _mech.collector == CollectorMode::RUN; }
  bool propulsionActive() const { return _drive.left_pct != 0 || _drive.right_pct != 0; }
  uint32_t framesSent() const { return _frames_sent; }

  // False after a failed send: the board may still run the previous frame.
  bool stateConfirmed() const { return _confirmed; }

private:
  ActuatorStatus send_(const DriveCommand& drive, const MechanismCommand& mech);

  static int8_t clampPct_(int pct);

  MotorBoard& _board;
  const Clock& _clock;

  // Commanded state (last frame the board accepted)
  DriveCommand _drive;
  MechanismCommand _mech;
  bool _confirmed = true;

  uint32_t _frames_sent = 0;
};
