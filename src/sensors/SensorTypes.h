#pragma once

#include <cstdint>
#include <ctime>

/*
===============================================================================
  SensorTypes.h
===============================================================================

  PURPOSE
  -------
  Value types produced by the SensorHub once per cycle.

  Every optional field is a Reading<T>: a value plus a freshness tag.
    - VALID        read this cycle
    - STALE        previous cycle's value re-used because this cycle's read
                   failed (load cell only); consumers must check fresh()
    - UNAVAILABLE  no value; value() is meaningless
===============================================================================
*/

enum class Freshness : uint8_t {
  UNAVAILABLE = 0,
  VALID,
  STALE,
};

template <typename T>
class Reading {
public:
  Reading() = default;

  static Reading valid(const T& v) { return Reading(v, Freshness::VALID); }
  static Reading stale(const T& v) { return Reading(v, Freshness::STALE); }
  static Reading unavailable() { return Reading(); }

  bool present() const { return _freshness != Freshness::UNAVAILABLE; }
  bool fresh() const { return _freshness == Freshness::VALID; }
  Freshness freshness() const { return _freshness; }

  // Only meaningful when present()
  const T& value() const { return _value; }

private:
  Reading(const T& v, Freshness f) : _value(v), _freshness(f) {}

  T _value{};
  Freshness _freshness = Freshness::UNAVAILABLE;
};

// TCS34725, clear-normalized to 8 bits per channel
struct Rgb8 {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
};

// Tilt from the MPU6050 accelerometer (degrees)
struct Orientation {
  double pitch_deg = 0.0;
  double roll_deg = 0.0;
};

// Decimal degrees, south/west negative
struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

/*
  One cycle's readings. Built by SensorHub::poll() and treated as immutable
  afterwards (the loop only ever holds it by const reference or copy).
*/
struct SensorSnapshot {
  uint32_t timestamp_ms = 0;      // monotonic, when the poll started
  std::time_t wall_time = 0;      // for the collection log

  Reading<Rgb8> color;
  Reading<double> distance_cm;
  Reading<Orientation> orientation;
  Reading<GeoPoint> gps;
  Reading<double> weight_kg;

  bool bin_full = false;
};

const char* freshnessName(Freshness f);
