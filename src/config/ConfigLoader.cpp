#include "config/ConfigLoader.h"

#include <ArduinoJson.h>

#include <fstream>
#include <sstream>

/*
===============================================================================
  ConfigLoader.cpp
===============================================================================

  Uses ArduinoJson for parsing, the same library the board protocol uses.
  The document is sized for a config file with every key present plus
  comments-free whitespace; a larger file fails with NoMemory.
===============================================================================
*/

static const char* TAG = "Config";

static constexpr size_t CONFIG_DOC_BYTES = 8192;


/*=============================================================================
  FIELD HELPERS
=============================================================================*/

static void warnType(const char* section, const char* key, const char* expected) {
  AMLAC_LOGW(TAG, "%s.%s: expected %s, keeping default", section, key, expected);
}

static void readDouble(JsonObjectConst obj, const char* section, const char* key, double& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return;
  if (!v.is<double>()) { warnType(section, key, "number"); return; }
  out = v.as<double>();
}

static void readU32(JsonObjectConst obj, const char* section, const char* key, uint32_t& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return;
  if (!v.is<uint32_t>()) { warnType(section, key, "unsigned integer"); return; }
  out = v.as<uint32_t>();
}

static void readInt(JsonObjectConst obj, const char* section, const char* key, int& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return;
  if (!v.is<int>()) { warnType(section, key, "integer"); return; }
  out = v.as<int>();
}

static void readU8(JsonObjectConst obj, const char* section, const char* key, uint8_t& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return;
  if (!v.is<uint8_t>()) { warnType(section, key, "byte"); return; }
  out = v.as<uint8_t>();
}

static void readBool(JsonObjectConst obj, const char* section, const char* key, bool& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return;
  if (!v.is<bool>()) { warnType(section, key, "boolean"); return; }
  out = v.as<bool>();
}

static void readString(JsonObjectConst obj, const char* section, const char* key, std::string& out) {
  JsonVariantConst v = obj[key];
  if (v.isNull()) return;
  if (!v.is<const char*>()) { warnType(section, key, "string"); return; }
  out = v.as<const char*>();
}


/*=============================================================================
  SECTIONS
=============================================================================*/

static void applyControl(JsonObjectConst o, ControlParams& c) {
  const char* s = "control";
  readDouble(o, s, "confidence_threshold", c.confidence_threshold);
  readU32(o, s, "loop_period_ms", c.loop_period_ms);
  readU32(o, s, "collection_ms", c.collection_ms);
  readU32(o, s, "bin_full_cooldown_ms", c.bin_full_cooldown_ms);
  readU32(o, s, "fault_backoff_ms", c.fault_backoff_ms);
  readU32(o, s, "hold_slice_ms", c.hold_slice_ms);
  readU32(o, s, "status_every_cycles", c.status_every_cycles);
  readBool(o, s, "obstacle_enabled", c.obstacle_enabled);
  readDouble(o, s, "obstacle_min_cm", c.obstacle_min_cm);
  readInt(o, s, "obstacle_turn_speed", c.obstacle_turn_speed);
  readU32(o, s, "obstacle_turn_ms", c.obstacle_turn_ms);
}

static void applyClassifier(JsonObjectConst o, ClassifierParams& c) {
  const char* s = "classifier";
  readU32(o, s, "deadline_ms", c.deadline_ms);
  readU32(o, s, "stop_timeout_ms", c.stop_timeout_ms);
  readInt(o, s, "input_size", c.input_size);
  readInt(o, s, "positive_class", c.positive_class);
  readString(o, s, "model_path", c.model_path);
  readInt(o, s, "threads", c.threads);
}

static void applySensors(JsonObjectConst o, SensorParams& c) {
  const char* s = "sensors";
  readU32(o, s, "i2c_retry_backoff_ms", c.i2c_retry_backoff_ms);
  readU32(o, s, "i2c_timeout_ms", c.i2c_timeout_ms);
  readDouble(o, s, "ultrasonic_min_cm", c.ultrasonic_min_cm);
  readDouble(o, s, "ultrasonic_max_cm", c.ultrasonic_max_cm);
  readU32(o, s, "ultrasonic_max_age_ms", c.ultrasonic_max_age_ms);
  readInt(o, s, "gps_min_fix_quality", c.gps_min_fix_quality);
  readInt(o, s, "gps_min_satellites", c.gps_min_satellites);
  readU32(o, s, "gps_max_fix_age_ms", c.gps_max_fix_age_ms);
  readInt(o, s, "load_cell_samples", c.load_cell_samples);
  readDouble(o, s, "load_cell_counts_per_gram", c.load_cell_counts_per_gram);
  readDouble(o, s, "load_cell_tare_offset", c.load_cell_tare_offset);
  readBool(o, s, "tare_at_startup", c.tare_at_startup);
  readU32(o, s, "tare_timeout_ms", c.tare_timeout_ms);
  readU32(o, s, "board_max_age_ms", c.board_max_age_ms);
}

static void applyDisplay(JsonObjectConst o, DisplayParams& c) {
  const char* s = "display";
  readU32(o, s, "refresh_ms", c.refresh_ms);
  readU32(o, s, "alert_hold_ms", c.alert_hold_ms);
}

static void applyDevices(JsonObjectConst o, DeviceParams& c) {
  const char* s = "devices";
  readString(o, s, "i2c_bus", c.i2c_bus);
  readU8(o, s, "color_address", c.color_address);
  readU8(o, s, "imu_address", c.imu_address);
  readString(o, s, "board_port", c.board_port);
  readU32(o, s, "board_baud", c.board_baud);
  readString(o, s, "gps_port", c.gps_port);
  readU32(o, s, "gps_baud", c.gps_baud);
  readString(o, s, "camera_frame", c.camera_frame);
}


namespace config {

bool applyJson(const std::string& json_text, RobotConfig& cfg, std::string& err) {
  DynamicJsonDocument doc(CONFIG_DOC_BYTES);

  DeserializationError parse_err = deserializeJson(doc, json_text);
  if (parse_err) {
    err = std::string("parse failed: ") + parse_err.c_str();
    return false;
  }

  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    err = "top level is not an object";
    return false;
  }

  JsonObjectConst section;

  section = root["control"].as<JsonObjectConst>();
  if (!section.isNull()) applyControl(section, cfg.control);

  section = root["classifier"].as<JsonObjectConst>();
  if (!section.isNull()) applyClassifier(section, cfg.classifier);

  section = root["sensors"].as<JsonObjectConst>();
  if (!section.isNull()) applySensors(section, cfg.sensors);

  section = root["display"].as<JsonObjectConst>();
  if (!section.isNull()) applyDisplay(section, cfg.display);

  section = root["devices"].as<JsonObjectConst>();
  if (!section.isNull()) applyDevices(section, cfg.devices);

  readString(root, "root", "collection_log", cfg.collection_log);

  const char* level = root["log_level"].as<const char*>();
  if (level) {
    LogLevel parsed;
    if (logging::parseLevel(level, parsed)) {
      cfg.log_level = parsed;
    } else {
      AMLAC_LOGW(TAG, "unknown log_level '%s', keeping default", level);
    }
  }

  return true;
}

bool loadFile(const std::string& path, RobotConfig& cfg, std::string& err) {
  std::ifstream in(path.c_str());
  if (!in) {
    err = "cannot open " + path;
    return false;
  }

  std::stringstream buf;
  buf << in.rdbuf();

  if (!applyJson(buf.str(), cfg, err)) {
    err = path + ": " + err;
    return false;
  }

  AMLAC_LOGI(TAG, "loaded %s", path.c_str());
  return true;
}

}  // namespace config
