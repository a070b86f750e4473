#pragma once

#include <cstdint>

/*
  Log.h

  Purpose:
  Tagged, printf-style logging to stderr.

  Format (one line per call):
    I (123456) SensorHub: GPS no fix

  Usage:
    static const char* TAG = "SensorHub";
    AMLAC_LOGW(TAG, "color read failed (retrying in %u ms)", backoff_ms);

  The timestamp is milliseconds since process start.
*/

enum class LogLevel : uint8_t {
  NONE = 0,
  ERROR,
  WARN,
  INFO,
  DEBUG,
};

namespace logging {

void setLevel(LogLevel level);
LogLevel level();

// Parses "error" / "warn" / "info" / "debug" / "none". Returns false if unknown.
bool parseLevel(const char* s, LogLevel& out);

void write(LogLevel level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

}  // namespace logging

#define AMLAC_LOG_AT(lvl, tag, ...)                        \
  do {                                                     \
    if (logging::level() >= (lvl)) {                       \
      logging::write((lvl), (tag), __VA_ARGS__);           \
    }                                                      \
  } while (0)

#define AMLAC_LOGE(tag, ...) AMLAC_LOG_AT(LogLevel::ERROR, tag, __VA_ARGS__)
#define AMLAC_LOGW(tag, ...) AMLAC_LOG_AT(LogLevel::WARN, tag, __VA_ARGS__)
#define AMLAC_LOGI(tag, ...) AMLAC_LOG_AT(LogLevel::INFO, tag, __VA_ARGS__)
#define AMLAC_LOGD(tag, ...) AMLAC_LOG_AT(LogLevel::DEBUG, tag, __VA_ARGS__)
