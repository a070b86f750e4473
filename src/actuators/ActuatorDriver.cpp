#include "actuators/ActuatorDriver.h"

#include <exception>

#include "utils/Log.h"

/*
===============================================================================
  ActuatorDriver.cpp
===============================================================================

  Every public command computes the desired (drive, mech) pair and calls
  send_(). send_() is a no-op when the pair matches the commanded state and
  the board confirmed that state with the last send.

  Interlock table:
    collector RUN  + propulsion != 0  -> refused (INTERLOCKED), nothing sent
    propulsion != 0 + start collector -> drive stop frame sent first
===============================================================================
*/

static const char* TAG = "Actuators";

const char* actuatorStatusName(ActuatorStatus status) {
  switch (status) {
    case ActuatorStatus::OK: return "OK";
    case ActuatorStatus::HARDWARE_ABSENT: return "HARDWARE_ABSENT";
    case ActuatorStatus::LINK_ERROR: return "LINK_ERROR";
    case ActuatorStatus::INTERLOCKED: return "INTERLOCKED";
    default: return "?";
  }
}

static bool sameDrive(const DriveCommand& a, const DriveCommand& b) {
  return a.left_pct == b.left_pct && a.right_pct == b.right_pct;
}

ActuatorDriver::ActuatorDriver(MotorBoard& board, const Clock& clock)
: _board(board),
  _clock(clock)
{
}

int8_t ActuatorDriver::clampPct_(int pct) {
  if (pct > 100) return 100;
  if (pct < -100) return -100;
  return (int8_t)pct;
}

ActuatorStatus ActuatorDriver::send_(const DriveCommand& drive, const MechanismCommand& mech) {
  if (_confirmed && sameDrive(drive, _drive) && mech.collector == _mech.collector) {
    return ActuatorStatus::OK;
  }

  const ActuatorStatus st = _board.sendCommand(drive, mech, _clock.nowMs());
  if (st != ActuatorStatus::OK) {
    _confirmed = false;
    AMLAC_LOGE(TAG, "command drive=%d/%d collector=%s failed: %s",
               (int)drive.left_pct, (int)drive.right_pct,
               mech.collector == CollectorMode::RUN ? "RUN" : "STOP",
               actuatorStatusName(st));
    return st;
  }

  _drive = drive;
  _mech = mech;
  _confirmed = true;
  _frames_sent++;
  return ActuatorStatus::OK;
}

ActuatorStatus ActuatorDriver::setPropulsion(int left_pct, int right_pct) {
  DriveCommand d;
  d.left_pct = clampPct_(left_pct);
  d.right_pct = clampPct_(right_pct);

  // Stopping is always allowed; moving is not while the conveyor runs
  const bool moving = (d.left_pct != 0 || d.right_pct != 0);
  if (moving && collectorRunning()) {
    AMLAC_LOGW(TAG, "propulsion %d/%d refused: collector running",
               (int)d.left_pct, (int)d.right_pct);
    return ActuatorStatus::INTERLOCKED;
  }

  return send_(d, _mech);
}

ActuatorStatus ActuatorDriver::stopPropulsion() {
  return setPropulsion(0, 0);
}

ActuatorStatus ActuatorDriver::startCollectionMechanism() {
  if (propulsionActive()) {
    const ActuatorStatus st = send_(DriveCommand(), _mech);
    if (st != ActuatorStatus::OK) return st;
  }

  MechanismCommand m;
  m.collector = CollectorMode::RUN;
  return send_(_drive, m);
}

ActuatorStatus ActuatorDriver::stopCollectionMechanism() {
  MechanismCommand m;
  m.collector = CollectorMode::STOP;
  return send_(_drive, m);
}

void ActuatorDriver::stopAll() noexcept {
  const DriveCommand stop_drive;
  const MechanismCommand stop_mech;

  bool accepted = false;
  try {
    const ActuatorStatus st = _board.sendCommand(stop_drive, stop_mech, _clock.nowMs());
    if (st == ActuatorStatus::OK) {
      accepted = true;
      _frames_sent++;
    } else {
      AMLAC_LOGE(TAG, "stopAll failed: %s", actuatorStatusName(st));
    }
  } catch (const std::exception& e) {
    AMLAC_LOGE(TAG, "stopAll threw: %s", e.what());
  }

  _drive = stop_drive;
  _mech = stop_mech;
  _confirmed = accepted;
}
