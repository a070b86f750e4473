#include "sensors/GpsReceiver.h"

#include <cmath>
#include <cstdlib>
#include <cstring>

#include "utils/Log.h"

static const char* TAG = "GpsReceiver";

// GGA has 14 comma-separated fields after the sentence id
static constexpr int GGA_MAX_FIELDS = 16;

namespace nmea {

static int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

bool checksumOk(const char* line) {
  if (line == nullptr || line[0] != '$') return false;

  uint8_t sum = 0;
  const char* p = line + 1;
  while (*p != '\0' && *p != '*') {
    sum ^= (uint8_t)*p;
    p++;
  }
  if (*p != '*') return false;   // no checksum field

  const int hi = hexValue(p[1]);
  const int lo = (hi < 0) ? -1 : hexValue(p[2]);
  if (hi < 0 || lo < 0) return false;

  return sum == (uint8_t)((hi << 4) | lo);
}

bool isGga(const char* line) {
  // $ttGGA,
  return line != nullptr && strlen(line) > 7 && line[0] == '$' &&
         strncmp(line + 3, "GGA,", 4) == 0;
}

bool toDecimalDegrees(const char* value, char hemisphere, double& out) {
  if (value == nullptr || value[0] == '\0') return false;

  char* end = nullptr;
  const double raw = strtod(value, &end);
  if (end == value || raw < 0.0) return false;

  const double degrees = std::floor(raw / 100.0);
  const double minutes = raw - degrees * 100.0;
  if (minutes >= 60.0) return false;

  double dd = degrees + minutes / 60.0;

  switch (hemisphere) {
    case 'N':
    case 'E':
      break;
    case 'S':
    case 'W':
      dd = -dd;
      break;
    default:
      return false;
  }

  out = dd;
  return true;
}

bool parseGga(const char* line, GgaSentence& out) {
  if (!isGga(line) || !checksumOk(line)) return false;

  // Copy the body (without "$" and "*hh") so fields can be split in place
  char body[GPS_LINE_BUFFER_BYTES];
  const char* star = strchr(line, '*');
  const size_t len = (size_t)(star - (line + 1));
  if (len >= sizeof(body)) return false;
  memcpy(body, line + 1, len);
  body[len] = '\0';

  const char* fields[GGA_MAX_FIELDS];
  int count = 0;
  char* p = body;
  fields[count++] = p;
  while (*p != '\0' && count < GGA_MAX_FIELDS) {
    if (*p == ',') {
      *p = '\0';
      fields[count++] = p + 1;
    }
    p++;
  }
  if (count < 8) return false;

  GgaSentence g;
  g.quality = (fields[6][0] != '\0') ? atoi(fields[6]) : 0;
  g.satellites = (fields[7][0] != '\0') ? atoi(fields[7]) : 0;

  if (g.quality > 0) {
    if (!toDecimalDegrees(fields[2], fields[3][0], g.lat)) return false;
    if (!toDecimalDegrees(fields[4], fields[5][0], g.lon)) return false;
  }

  out = g;
  return true;
}

}  // namespace nmea

GpsReceiver::GpsReceiver(Stream& serial, int min_quality, int min_satellites, uint32_t max_age_ms)
: _serial(serial),
  _min_quality(min_quality),
  _min_satellites(min_satellites),
  _max_age_ms(max_age_ms)
{
  memset(_line, 0, sizeof(_line));
}

void GpsReceiver::setLimits(int min_quality, int min_satellites, uint32_t max_age_ms) {
  _min_quality = min_quality;
  _min_satellites = min_satellites;
  _max_age_ms = max_age_ms;
}

void GpsReceiver::tick(uint32_t now_ms) {
  while (_serial.available() > 0) {
    int c = _serial.read();
    if (c < 0) break;

    char ch = (char)c;
    if (ch == '\r') continue;

    if (_dropping) {
      if (ch == '\n') {
        _dropping = false;
        _line_len = 0;
      }
      continue;
    }

    if (ch == '\n') {
      _line[_line_len] = '\0';
      handleLine_(now_ms);
      _line_len = 0;
      continue;
    }

    // A new '$' mid-line means the previous sentence was cut short
    if (ch == '$') _line_len = 0;

    if (_line_len + 1 < LINE_SIZE) {
      _line[_line_len++] = ch;
    } else {
      _dropping = true;
      _line_len = 0;
    }
  }
}

void GpsReceiver::handleLine_(uint32_t now_ms) {
  if (!nmea::isGga(_line)) return;

  _sentences++;

  nmea::GgaSentence g;
  if (!nmea::parseGga(_line, g)) {
    _bad_checksum++;
    AMLAC_LOGD(TAG, "bad GGA (%lu): %.32s", (unsigned long)_bad_checksum, _line);
    return;
  }

  _latest = g;
  _latest_ms = now_ms;
  _has_new = true;
}

bool GpsReceiver::readFix(GeoPoint& out, uint32_t now_ms) {
  if (!_serial.isOpen()) return false;

  tick(now_ms);

  if (!_has_new) return false;
  _has_new = false;

  if ((uint32_t)(now_ms - _latest_ms) > _max_age_ms) return false;
  if (_latest.quality < _min_quality) return false;
  if (_latest.satellites < _min_satellites) return false;

  out.lat = _latest.lat;
  out.lon = _latest.lon;
  return true;
}
