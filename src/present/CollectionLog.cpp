#include "present/CollectionLog.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <time.h>
#include <vector>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "utils/Log.h"

static const char* TAG = "CollectionLog";

static constexpr int COLUMN_COUNT = 9;

const char* CollectionLog::header() {
  return "Timestamp,Algae_Detected,Confidence,GPS_Lat,GPS_Lon,Weight_kg,"
         "Collection_Count,Distance_cm,Orientation";
}

// mkdir -p for the directory part of path
static bool makeParentDirs(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return true;

  const std::string dir = path.substr(0, slash);
  for (size_t i = 1; i <= dir.size(); i++) {
    if (i != dir.size() && dir[i] != '/') continue;

    const std::string part = dir.substr(0, i);
    if (mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) {
      AMLAC_LOGE(TAG, "mkdir %s: %s", part.c_str(), strerror(errno));
      return false;
    }
  }
  return true;
}

// Writes text and forces it to disk
static bool appendDurable(const std::string& path, const std::string& text) {
  FILE* f = fopen(path.c_str(), "a");
  if (!f) {
    AMLAC_LOGE(TAG, "open %s: %s", path.c_str(), strerror(errno));
    return false;
  }

  bool ok = fwrite(text.data(), 1, text.size(), f) == text.size();
  ok = (fflush(f) == 0) && ok;
  ok = (fsync(fileno(f)) == 0) && ok;
  if (fclose(f) != 0) ok = false;

  if (!ok) AMLAC_LOGE(TAG, "write %s: %s", path.c_str(), strerror(errno));
  return ok;
}

bool CollectionLog::open() {
  struct stat st;
  if (stat(_path.c_str(), &st) == 0) {
    _ready = true;
    AMLAC_LOGI(TAG, "appending to %s", _path.c_str());
    return true;
  }

  if (!makeParentDirs(_path)) return false;
  if (!appendDurable(_path, std::string(header()) + "\n")) return false;

  _ready = true;
  AMLAC_LOGI(TAG, "created %s", _path.c_str());
  return true;
}

std::string CollectionLog::formatRow(const CollectionEvent& e) {
  char ts[32] = {0};
  struct tm local;
  if (localtime_r(&e.timestamp, &local) != nullptr) {
    strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &local);
  }

  char lat[32] = {0}, lon[32] = {0};
  if (e.has_gps) {
    snprintf(lat, sizeof(lat), "%.6f", e.gps.lat);
    snprintf(lon, sizeof(lon), "%.6f", e.gps.lon);
  }

  char dist[32] = {0};
  if (e.has_distance) snprintf(dist, sizeof(dist), "%.2f", e.distance_cm);

  char orient[48] = {0};
  if (e.has_orientation) {
    snprintf(orient, sizeof(orient), "P:%.1f R:%.1f",
             e.orientation.pitch_deg, e.orientation.roll_deg);
  }

  char row[256];
  snprintf(row, sizeof(row), "%s,%s,%.4f,%s,%s,%.2f,%llu,%s,%s",
           ts,
           e.detected ? "Yes" : "No",
           e.confidence,
           lat, lon,
           e.weight_kg,
           (unsigned long long)e.collection_count,
           dist,
           orient);
  return row;
}

static std::vector<std::string> splitCsv(const std::string& line) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    const size_t comma = line.find(',', start);
    if (comma == std::string::npos) {
      out.push_back(line.substr(start));
      break;
    }
    out.push_back(line.substr(start, comma - start));
    start = comma + 1;
  }
  return out;
}

static bool parseDouble(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  out = strtod(s.c_str(), &end);
  return end != s.c_str() && *end == '\0';
}

bool CollectionLog::parseRow(const std::string& raw, CollectionEvent& out) {
  std::string line = raw;
  if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);

  const std::vector<std::string> f = splitCsv(line);
  if ((int)f.size() != COLUMN_COUNT) return false;

  CollectionEvent e;

  struct tm local;
  memset(&local, 0, sizeof(local));
  const char* end = strptime(f[0].c_str(), "%Y-%m-%d %H:%M:%S", &local);
  if (end == nullptr || *end != '\0') return false;
  local.tm_isdst = -1;
  e.timestamp = mktime(&local);

  if (f[1] == "Yes") {
    e.detected = true;
  } else if (f[1] == "No") {
    e.detected = false;
  } else {
    return false;
  }

  if (!parseDouble(f[2], e.confidence)) return false;

  if (!f[3].empty() || !f[4].empty()) {
    if (!parseDouble(f[3], e.gps.lat) || !parseDouble(f[4], e.gps.lon)) return false;
    e.has_gps = true;
  }

  if (!parseDouble(f[5], e.weight_kg)) return false;

  char* count_end = nullptr;
  e.collection_count = strtoull(f[6].c_str(), &count_end, 10);
  if (f[6].empty() || *count_end != '\0') return false;

  if (!f[7].empty()) {
    if (!parseDouble(f[7], e.distance_cm)) return false;
    e.has_distance = true;
  }

  if (!f[8].empty()) {
    double pitch = 0.0, roll = 0.0;
    if (sscanf(f[8].c_str(), "P:%lf R:%lf", &pitch, &roll) != 2) return false;
    e.orientation.pitch_deg = pitch;
    e.orientation.roll_deg = roll;
    e.has_orientation = true;
  }

  out = e;
  return true;
}

bool CollectionLog::append(const CollectionEvent& e) {
  if (!_ready && !open()) {
    _write_failures++;
    return false;
  }

  if (!appendDurable(_path, formatRow(e) + "\n")) {
    _write_failures++;
    return false;
  }

  AMLAC_LOGI(TAG, "logged collection #%llu (confidence %.2f)",
             (unsigned long long)e.collection_count, e.confidence);
  return true;
}

bool CollectionLog::statistics(LogStatistics& out) const {
  std::ifstream in(_path.c_str());
  if (!in) return false;

  LogStatistics s;
  double confidence_sum = 0.0;
  uint32_t confidence_count = 0;

  std::string line;
  bool first = true;
  while (std::getline(in, line)) {
    if (first) {
      first = false;
      continue;   // header
    }
    if (line.empty()) continue;

    s.rows++;

    CollectionEvent e;
    if (!parseRow(line, e)) {
      AMLAC_LOGD(TAG, "unparsable row %lu", (unsigned long)s.rows);
      continue;
    }
    if (e.detected) {
      s.detections++;
      confidence_sum += e.confidence;
      confidence_count++;
    }
  }

  s.average_confidence = confidence_count > 0 ? confidence_sum / confidence_count : 0.0;
  s.detection_rate = s.rows > 0 ? (double)s.detections / s.rows : 0.0;
  out = s;
  return true;
}
