#pragma once

#include <cstdint>
#include <string>

#include "Devices.h"
#include "Params.h"
#include "utils/Log.h"

/*
===============================================================================
  RobotConfig.h
===============================================================================

  PURPOSE
  -------
  Runtime configuration. Every field starts at its Params.h / Devices.h
  default; ConfigLoader overrides fields present in the JSON config file.

  Grouped by the subsystem that consumes it so each component can take only
  its own section.
===============================================================================
*/

struct ControlParams {
  double confidence_threshold = CONFIDENCE_THRESHOLD;

  uint32_t loop_period_ms = MAIN_LOOP_PERIOD_MS;
  uint32_t collection_ms = COLLECTION_DURATION_MS;
  uint32_t bin_full_cooldown_ms = BIN_FULL_COOLDOWN_MS;
  uint32_t fault_backoff_ms = FAULT_BACKOFF_MS;
  uint32_t hold_slice_ms = HOLD_SLICE_MS;
  uint32_t status_every_cycles = STATUS_EVERY_CYCLES;

  bool obstacle_enabled = OBSTACLE_AVOIDANCE_ENABLED;
  double obstacle_min_cm = OBSTACLE_MIN_DISTANCE_CM;
  int obstacle_turn_speed = OBSTACLE_TURN_SPEED_PCT;
  uint32_t obstacle_turn_ms = OBSTACLE_TURN_MS;
};

struct ClassifierParams {
  uint32_t deadline_ms = CLASSIFIER_DEADLINE_MS;
  uint32_t stop_timeout_ms = CLASSIFIER_STOP_TIMEOUT_MS;
  int input_size = MODEL_INPUT_SIZE;      // replaced by the loaded model's input
  int positive_class = MODEL_POSITIVE_CLASS;

  std::string model_path = MODEL_PATH;
  int threads = MODEL_THREADS;
};

struct SensorParams {
  uint32_t i2c_retry_backoff_ms = I2C_RETRY_BACKOFF_MS;
  uint32_t i2c_timeout_ms = I2C_TRANSFER_TIMEOUT_MS;

  double ultrasonic_min_cm = ULTRASONIC_MIN_CM;
  double ultrasonic_max_cm = ULTRASONIC_MAX_CM;
  uint32_t ultrasonic_max_age_ms = ULTRASONIC_MAX_AGE_MS;

  int gps_min_fix_quality = GPS_MIN_FIX_QUALITY;
  int gps_min_satellites = GPS_MIN_SATELLITES;
  uint32_t gps_max_fix_age_ms = GPS_MAX_FIX_AGE_MS;

  int load_cell_samples = LOAD_CELL_SAMPLES;
  double load_cell_counts_per_gram = LOAD_CELL_COUNTS_PER_GRAM;
  double load_cell_tare_offset = LOAD_CELL_TARE_OFFSET;
  bool tare_at_startup = true;
  uint32_t tare_timeout_ms = LOAD_CELL_TARE_TIMEOUT_MS;

  uint32_t board_max_age_ms = BOARD_TELEMETRY_MAX_AGE_MS;
};

struct DisplayParams {
  uint32_t refresh_ms = DISPLAY_REFRESH_MS;
  uint32_t alert_hold_ms = DISPLAY_ALERT_HOLD_MS;
};

struct DeviceParams {
  std::string i2c_bus = I2C_BUS_PATH;
  uint8_t color_address = TCS34725_I2C_ADDRESS;
  uint8_t imu_address = MPU6050_I2C_ADDRESS;

  std::string board_port = BOARD_SERIAL_PATH;
  uint32_t board_baud = BOARD_SERIAL_BAUD;

  std::string gps_port = GPS_SERIAL_PATH;
  uint32_t gps_baud = GPS_SERIAL_BAUD;

  std::string camera_frame = CAMERA_FRAME_PATH;
};

struct RobotConfig {
  ControlParams control;
  ClassifierParams classifier;
  SensorParams sensors;
  DisplayParams display;
  DeviceParams devices;

  std::string collection_log = COLLECTION_LOG_PATH;
  LogLevel log_level = LogLevel::INFO;
};
