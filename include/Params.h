#pragma once
#include <cstddef>
#include <cstdint>

/*
  Params.h

  Purpose:
  Central location for controller constants and tunable defaults.
  Every value here can be overridden at runtime from the JSON config file
  (see config/ConfigLoader.h); these are the values used when it is silent.

  Target:
  Raspberry Pi class Linux board + low-level motor board over USB serial

  Convention:
  - Durations: milliseconds (ms)
  - Distances: centimeters (cm)
  - Mass: kilograms (kg), load cell scale in raw counts per gram
  - Angles: degrees
  - Motor speeds: signed percent (-100..100)
*/

/* ============================================================================
   DECISION
============================================================================ */

// Verdict must be detected AND strictly above this to start a collection
constexpr double CONFIDENCE_THRESHOLD = 0.70;

/* ============================================================================
   CYCLE TIMING
============================================================================ */

// Target wall-clock period of one capture -> present cycle
constexpr uint32_t MAIN_LOOP_PERIOD_MS = 2000;

// How long the conveyor runs for one collection
constexpr uint32_t COLLECTION_DURATION_MS = 5000;

// Hold after a bin-full condition before scanning again
constexpr uint32_t BIN_FULL_COOLDOWN_MS = 10000;

// Hold after a fault (motors already stopped) before scanning again
constexpr uint32_t FAULT_BACKOFF_MS = 5000;

// Holds sleep in slices of this size and check for cancellation in between
constexpr uint32_t HOLD_SLICE_MS = 100;

// Log a status summary every N cycles (0 disables)
constexpr uint32_t STATUS_EVERY_CYCLES = 30;

/* ============================================================================
   CLASSIFIER
============================================================================ */

constexpr uint32_t CLASSIFIER_DEADLINE_MS = 500;

// Longest shutdown waits for a running inference before abandoning it
constexpr uint32_t CLASSIFIER_STOP_TIMEOUT_MS = 1000;

// Teachable Machine export: 224 x 224 RGB, [no_algae, algae]
constexpr int MODEL_INPUT_SIZE = 224;
constexpr int MODEL_POSITIVE_CLASS = 1;

constexpr const char* MODEL_PATH = "/home/pi/amlac_robot/models/model.tflite";
constexpr int MODEL_THREADS = 2;

/* ============================================================================
   I2C SENSORS (TCS34725 color, MPU6050 inertial)
============================================================================ */

// One retry after this backoff, then the field is marked absent
constexpr uint32_t I2C_RETRY_BACKOFF_MS = 5;
constexpr uint32_t I2C_TRANSFER_TIMEOUT_MS = 20;

/* ============================================================================
   ULTRASONIC (JSN-SR04T, timed on the motor board)
============================================================================ */

// Echo timeout used by the board firmware
constexpr uint32_t ULTRASONIC_ECHO_TIMEOUT_MS = 30;

constexpr double ULTRASONIC_MIN_CM = 2.0;
constexpr double ULTRASONIC_MAX_CM = 400.0;

// Telemetry older than this does not count as a reading for this cycle
constexpr uint32_t ULTRASONIC_MAX_AGE_MS = 250;

/* ============================================================================
   GPS (NEO-6M)
============================================================================ */

constexpr int GPS_MIN_FIX_QUALITY = 1;
constexpr int GPS_MIN_SATELLITES = 4;
constexpr uint32_t GPS_MAX_FIX_AGE_MS = 2500;

// Longest NMEA sentence is 82 chars; leave room for junk
constexpr size_t GPS_LINE_BUFFER_BYTES = 128;

/* ============================================================================
   LOAD CELL (HX711, sampled on the motor board)
============================================================================ */

constexpr int LOAD_CELL_SAMPLES = 5;
constexpr double LOAD_CELL_COUNTS_PER_GRAM = 2280.0;
constexpr double LOAD_CELL_TARE_OFFSET = 0.0;

// Startup tare gives up after this long waiting for samples
constexpr uint32_t LOAD_CELL_TARE_TIMEOUT_MS = 3000;

// Raw samples kept from telemetry between polls
constexpr size_t LOAD_CELL_QUEUE_DEPTH = 16;

/* ============================================================================
   OBSTACLE STOP-AND-TURN (off unless enabled in config)
============================================================================ */

constexpr bool OBSTACLE_AVOIDANCE_ENABLED = false;
constexpr double OBSTACLE_MIN_DISTANCE_CM = 10.0;
constexpr int OBSTACLE_TURN_SPEED_PCT = 40;
constexpr uint32_t OBSTACLE_TURN_MS = 2000;

/* ============================================================================
   DISPLAY (16x2 character panel)
============================================================================ */

constexpr size_t DISPLAY_COLUMNS = 16;

// Panel refresh cadence for routine pages
constexpr uint32_t DISPLAY_REFRESH_MS = 500;

// Alerts (error, bin full, detection) own the panel at least this long
constexpr uint32_t DISPLAY_ALERT_HOLD_MS = 3000;

/* ============================================================================
   BOARD LINK / SERIAL
============================================================================ */

constexpr uint16_t SERIAL_LINE_BUFFER_BYTES = 1024;

// Bin switch state from telemetry older than this is treated as unavailable
constexpr uint32_t BOARD_TELEMETRY_MAX_AGE_MS = 1000;

// Board telemetry frames are small; this leaves headroom for the note
constexpr size_t SERIAL_JSON_DOC_BYTES = 512;

/* ============================================================================
   LOGGING / PERSISTENCE
============================================================================ */

constexpr const char* COLLECTION_LOG_PATH = "/home/pi/amlac_robot/collection_log.csv";
