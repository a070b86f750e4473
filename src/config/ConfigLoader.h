#pragma once

#include <string>

#include "config/RobotConfig.h"

/*
===============================================================================
  ConfigLoader.h
===============================================================================

  PURPOSE
  -------
  Overlay a JSON config file on top of the compiled-in defaults.

  File layout (every key optional):
    {
      "control":    { "confidence_threshold": 0.7, "loop_period_ms": 2000, ... },
      "classifier": { "deadline_ms": 500, ... },
      "sensors":    { "gps_min_satellites": 4, ... },
      "display":    { "refresh_ms": 500, "alert_hold_ms": 3000 },
      "devices":    { "board_port": "/dev/ttyACM0", ... },
      "collection_log": "/home/pi/amlac_robot/collection_log.csv",
      "log_level": "info"
    }

  Rules:
    - Missing keys keep their default
    - Keys of the wrong JSON type keep their default (and are logged)
    - Unknown keys are ignored
===============================================================================
*/

namespace config {

/*
  Parses JSON text into cfg (which should already hold defaults).

  Returns:
    - true on success
    - false if the text is not a JSON object (err describes why)
*/
bool applyJson(const std::string& json_text, RobotConfig& cfg, std::string& err);

// Reads path and calls applyJson(). False if the file cannot be read.
bool loadFile(const std::string& path, RobotConfig& cfg, std::string& err);

}  // namespace config
