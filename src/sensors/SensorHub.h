#pragma once

#include <cstdint>

#include "config/RobotConfig.h"
#include "sensors/SensorSources.h"
#include "sensors/SensorTypes.h"
#include "utils/Clock.h"

/*
===============================================================================
  SensorHub.h
===============================================================================

  PURPOSE
  -------
  Polls every sensor source once per cycle and builds one SensorSnapshot.

  Policy (per source):
    - color, orientation (I2C): one retry after i2c_retry_backoff_ms, then
      UNAVAILABLE
    - distance, gps: single non-blocking read, UNAVAILABLE on failure
    - weight: mean of load_cell_samples raw samples, tared and scaled to kg;
      samples short of a full average are kept for the next cycle, and until
      it completes the previous weight is reported STALE (UNAVAILABLE if
      there never was one)
    - bin switch: unavailable counts as not full (warning logged)

  A source pointer may be null (not fitted); its field is then always
  UNAVAILABLE. One source failing never stops the others being read.
===============================================================================
*/

struct SensorSourceSet {
  ColorSource* color = nullptr;
  OrientationSource* orientation = nullptr;
  PositionSource* position = nullptr;
  RangeSource* range = nullptr;
  LoadCellSource* load_cell = nullptr;
  SwitchSource* bin_switch = nullptr;
};

class SensorHub {
public:
  SensorHub(const SensorSourceSet& sources, Clock& clock, const SensorParams& params);

  SensorSnapshot poll();

  /*
    Averages load_cell_samples raw samples and stores the result as the tare
    offset. Waits up to timeout_ms for samples to arrive. On failure the
    current offset is kept and false is returned.
  */
  bool tareLoadCell(uint32_t timeout_ms);

  double tareOffset() const { return _tare_offset; }

  // Raw counts -> kg with the current tare and scale
  double countsToKg(double raw_mean) const;

  uint32_t i2cRetries() const { return _i2c_retries; }

private:
  Reading<Rgb8> readColor_();
  Reading<Orientation> readOrientation_();
  Reading<GeoPoint> readGps_(uint32_t now_ms);
  Reading<double> readDistance_(uint32_t now_ms);
  Reading<double> readWeight_(uint32_t now_ms);
  bool readBinFull_(uint32_t now_ms);

  bool meanRaw_(uint32_t now_ms, double& mean);

  SensorSourceSet _src;
  Clock& _clock;
  SensorParams _params;

  double _tare_offset;

  // Load cell average in progress (may span cycles)
  double _partial_sum = 0.0;
  int _partial_count = 0;

  // Weight cache for STALE reporting
  bool _has_weight = false;
  double _last_weight_kg = 0.0;

  bool _bin_switch_warned = false;
  uint32_t _i2c_retries = 0;
};
