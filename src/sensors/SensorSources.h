#pragma once

#include <cstdint>

#include "sensors/SensorTypes.h"

/*
===============================================================================
  SensorSources.h
===============================================================================

  PURPOSE
  -------
  One narrow interface per physical source the SensorHub polls.

  Every read:
    - returns true and fills `out` on success
    - returns false on any failure (bus error, timeout, no data)
    - never blocks past its own bounded timeout

  Retry, staleness and unit normalization policy live in SensorHub, not here.
===============================================================================
*/

class ColorSource {
public:
  virtual ~ColorSource() = default;
  virtual bool readRgb(Rgb8& out) = 0;
};

class OrientationSource {
public:
  virtual ~OrientationSource() = default;
  virtual bool readOrientation(Orientation& out) = 0;
};

class PositionSource {
public:
  virtual ~PositionSource() = default;

  // Valid fix decoded from the data that arrived since the previous call.
  virtual bool readFix(GeoPoint& out, uint32_t now_ms) = 0;
};

class RangeSource {
public:
  virtual ~RangeSource() = default;
  virtual bool readDistanceCm(double& out, uint32_t now_ms) = 0;
};

class LoadCellSource {
public:
  virtual ~LoadCellSource() = default;

  // One raw (untared, unscaled) HX711 sample.
  virtual bool readRaw(int32_t& out, uint32_t now_ms) = 0;
};

class SwitchSource {
public:
  virtual ~SwitchSource() = default;

  // active = float switch closed (bin full).
  virtual bool readActive(bool& active, uint32_t now_ms) = 0;
};
