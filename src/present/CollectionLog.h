#pragma once

#include <cstdint>
#include <ctime>
#include <string>

#include "sensors/SensorTypes.h"

/*
===============================================================================
  CollectionLog.h
===============================================================================

  PURPOSE
  -------
  Append-only CSV record of completed collections.

  Columns (in order):
    Timestamp,Algae_Detected,Confidence,GPS_Lat,GPS_Lon,Weight_kg,
    Collection_Count,Distance_cm,Orientation

  Formats:
    Timestamp     YYYY-MM-DD HH:MM:SS (local time)
    Detected      Yes / No
    Confidence    %.4f
    Lat / Lon     %.6f
    Weight, Dist  %.2f
    Orientation   P:<pitch %.1f> R:<roll %.1f>
  Missing optional fields are empty.

  The file and its parent directory are created (with the header) when
  absent. Each record is flushed and fsync'd before append() returns.
===============================================================================
*/

struct CollectionEvent {
  std::time_t timestamp = 0;
  bool detected = false;
  double confidence = 0.0;

  bool has_gps = false;
  GeoPoint gps;

  double weight_kg = 0.0;
  uint64_t collection_count = 0;

  bool has_distance = false;
  double distance_cm = 0.0;

  bool has_orientation = false;
  Orientation orientation;
};

struct LogStatistics {
  uint32_t rows = 0;
  uint32_t detections = 0;
  double average_confidence = 0.0;   // over detected rows
  double detection_rate = 0.0;       // detections / rows
};

class CollectionLog {
public:
  explicit CollectionLog(const std::string& path) : _path(path) {}

  // Creates parent directories and the header if the file is absent.
  bool open();

  bool append(const CollectionEvent& e);

  // Independent reader over the whole file. False if it cannot be read.
  bool statistics(LogStatistics& out) const;

  const std::string& path() const { return _path; }
  uint32_t writeFailures() const { return _write_failures; }

  static const char* header();
  static std::string formatRow(const CollectionEvent& e);
  static bool parseRow(const std::string& line, CollectionEvent& out);

private:
  std::string _path;
  bool _ready = false;
  uint32_t _write_failures = 0;
};
