#pragma once

#include <cstdint>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines command and telemetry data structures exchanged between the
  controller and the motor board over newline-delimited JSON.

  Must mirror the motor board firmware field names exactly.

  Notes:
  - Optional telemetry fields carry an explicit *_present flag and are
    encoded as JSON null when absent.
===============================================================================
*/


/*=============================================================================
  COMMAND STRUCTURES (Controller -> Board)
=============================================================================*/

// "drive": {"left": <int>, "right": <int>}   signed percent, -100..100
struct DriveCommand {
  int8_t left_pct = 0;
  int8_t right_pct = 0;
};

// Collection conveyor (TB6600 stepper) run state
enum class CollectorMode : uint8_t {
  STOP = 0,
  RUN,
};

// "mech": {"collector": "RUN" | "STOP"}
struct MechanismCommand {
  CollectorMode collector = CollectorMode::STOP;
};

// Full command frame
struct CommandFrame {
  uint32_t seq = 0;
  uint32_t host_time_ms = 0;

  DriveCommand drive;
  MechanismCommand mech;
};


/*=============================================================================
  TELEMETRY STRUCTURES (Board -> Controller)
=============================================================================*/

// {"valid": <bool>, "distance_cm": <float>|null}
struct UltrasonicTelemetry {
  bool valid = false;
  float distance_cm = 0.0f;
};

// {"raw": <int>|null}
struct LoadCellTelemetry {
  bool present = false;
  int32_t raw = 0;
};

// Full telemetry frame
struct TelemetryFrame {
  uint32_t board_time_ms = 0;
  uint32_t ack_seq = 0;

  UltrasonicTelemetry ultrasonic;
  LoadCellTelemetry load_cell;

  bool bin_full_present = false;
  bool bin_full = false;

  char note[64] = {0};   // optional firmware debug string, empty if null

  bool valid = false;  // set true after successful decode
};
