#pragma once

#include <cstddef>
#include <cstdint>

#include "Params.h"
#include "comms/Stream.h"
#include "sensors/SensorSources.h"

/*
===============================================================================
  GpsReceiver.h
===============================================================================

  PURPOSE
  -------
  NEO-6M position source. Reads NMEA 0183 from a non-blocking Stream and
  keeps the most recent GGA sentence.

  Rules for a usable fix:
    - checksum present and correct
    - fix quality >= min_quality
    - satellites in use >= min_satellites
    - received no longer than max_age_ms ago
    - received since the previous readFix() call

  Nothing is synthesized: when the latest GGA fails any rule, there is no fix.
===============================================================================
*/

namespace nmea {

struct GgaSentence {
  double lat = 0.0;       // decimal degrees, south negative
  double lon = 0.0;       // decimal degrees, west negative
  int quality = 0;        // 0 = invalid, 1 = GPS, 2 = DGPS, ...
  int satellites = 0;
};

// XOR of the bytes between '$' and '*' against the two hex digits after '*'.
bool checksumOk(const char* line);

// True if the line is a GGA sentence from any talker ($GPGGA, $GNGGA, ...).
bool isGga(const char* line);

// Parses a checksummed GGA line. Fields may be empty (no fix): quality and
// satellites are then 0 and lat/lon are left at 0.
bool parseGga(const char* line, GgaSentence& out);

// "ddmm.mmmm" / "dddmm.mmmm" + hemisphere to signed decimal degrees.
bool toDecimalDegrees(const char* value, char hemisphere, double& out);

}  // namespace nmea

class GpsReceiver : public PositionSource {
public:
  GpsReceiver(Stream& serial, int min_quality, int min_satellites, uint32_t max_age_ms);

  // Drains available bytes and parses complete lines. Never blocks.
  void tick(uint32_t now_ms);

  bool readFix(GeoPoint& out, uint32_t now_ms) override;

  void setLimits(int min_quality, int min_satellites, uint32_t max_age_ms);

  uint32_t sentences() const { return _sentences; }
  uint32_t checksumErrors() const { return _bad_checksum; }

private:
  void handleLine_(uint32_t now_ms);

  Stream& _serial;

  int _min_quality;
  int _min_satellites;
  uint32_t _max_age_ms;

  static constexpr size_t LINE_SIZE = GPS_LINE_BUFFER_BYTES;
  char _line[LINE_SIZE];
  size_t _line_len = 0;
  bool _dropping = false;

  nmea::GgaSentence _latest;
  bool _has_new = false;      // GGA received since the previous readFix()
  uint32_t _latest_ms = 0;

  uint32_t _sentences = 0;
  uint32_t _bad_checksum = 0;
};
