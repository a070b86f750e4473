#include "sensors/SensorHub.h"

#include "utils/Log.h"

static const char* TAG = "SensorHub";

// Wait between empty load cell reads while taring
static constexpr uint32_t TARE_POLL_MS = 20;

const char* freshnessName(Freshness f) {
  switch (f) {
    case Freshness::VALID: return "VALID";
    case Freshness::STALE: return "STALE";
    case Freshness::UNAVAILABLE:
    default: return "UNAVAILABLE";
  }
}

/*
  Bounded I2C retry: at most two attempts per read, separated by one backoff.
*/
template <typename ReadFn>
static bool readWithRetry(Clock& clock, uint32_t backoff_ms, uint32_t& retries, ReadFn read) {
  if (read()) return true;

  retries++;
  clock.sleepMs(backoff_ms);
  return read();
}

SensorHub::SensorHub(const SensorSourceSet& sources, Clock& clock, const SensorParams& params)
: _src(sources),
  _clock(clock),
  _params(params),
  _tare_offset(params.load_cell_tare_offset)
{
  if (_params.load_cell_samples < 1) _params.load_cell_samples = 1;
}

SensorSnapshot SensorHub::poll() {
  SensorSnapshot s;
  s.timestamp_ms = _clock.nowMs();
  s.wall_time = _clock.wallTime();

  s.color = readColor_();
  s.orientation = readOrientation_();
  s.gps = readGps_(_clock.nowMs());
  s.distance_cm = readDistance_(_clock.nowMs());
  s.weight_kg = readWeight_(_clock.nowMs());
  s.bin_full = readBinFull_(_clock.nowMs());

  AMLAC_LOGD(TAG, "poll color=%s orient=%s gps=%s dist=%s weight=%s bin_full=%d",
             freshnessName(s.color.freshness()),
             freshnessName(s.orientation.freshness()),
             freshnessName(s.gps.freshness()),
             freshnessName(s.distance_cm.freshness()),
             freshnessName(s.weight_kg.freshness()),
             (int)s.bin_full);
  return s;
}

Reading<Rgb8> SensorHub::readColor_() {
  if (_src.color == nullptr) return Reading<Rgb8>::unavailable();

  Rgb8 rgb;
  ColorSource* src = _src.color;
  if (!readWithRetry(_clock, _params.i2c_retry_backoff_ms, _i2c_retries,
                     [&]() { return src->readRgb(rgb); })) {
    AMLAC_LOGD(TAG, "color unavailable after retry");
    return Reading<Rgb8>::unavailable();
  }
  return Reading<Rgb8>::valid(rgb);
}

Reading<Orientation> SensorHub::readOrientation_() {
  if (_src.orientation == nullptr) return Reading<Orientation>::unavailable();

  Orientation o;
  OrientationSource* src = _src.orientation;
  if (!readWithRetry(_clock, _params.i2c_retry_backoff_ms, _i2c_retries,
                     [&]() { return src->readOrientation(o); })) {
    AMLAC_LOGD(TAG, "orientation unavailable after retry");
    return Reading<Orientation>::unavailable();
  }
  return Reading<Orientation>::valid(o);
}

Reading<GeoPoint> SensorHub::readGps_(uint32_t now_ms) {
  if (_src.position == nullptr) return Reading<GeoPoint>::unavailable();

  GeoPoint p;
  if (!_src.position->readFix(p, now_ms)) return Reading<GeoPoint>::unavailable();
  return Reading<GeoPoint>::valid(p);
}

Reading<double> SensorHub::readDistance_(uint32_t now_ms) {
  if (_src.range == nullptr) return Reading<double>::unavailable();

  double cm = 0.0;
  if (!_src.range->readDistanceCm(cm, now_ms)) return Reading<double>::unavailable();
  return Reading<double>::valid(cm);
}

/*
  Samples arrive with board telemetry, not on demand. A short read keeps
  what it got and the next cycle continues the same average.
*/
bool SensorHub::meanRaw_(uint32_t now_ms, double& mean) {
  if (_src.load_cell == nullptr) return false;

  while (_partial_count < _params.load_cell_samples) {
    int32_t raw = 0;
    if (!_src.load_cell->readRaw(raw, now_ms)) {
      AMLAC_LOGD(TAG, "load cell: %d/%d samples, continuing next cycle",
                 _partial_count, _params.load_cell_samples);
      return false;
    }
    _partial_sum += (double)raw;
    _partial_count++;
  }

  mean = _partial_sum / _partial_count;
  _partial_sum = 0.0;
  _partial_count = 0;
  return true;
}

double SensorHub::countsToKg(double raw_mean) const {
  if (_params.load_cell_counts_per_gram == 0.0) return 0.0;
  const double grams = (raw_mean - _tare_offset) / _params.load_cell_counts_per_gram;
  return grams / 1000.0;
}

Reading<double> SensorHub::readWeight_(uint32_t now_ms) {
  double mean = 0.0;
  if (!meanRaw_(now_ms, mean)) {
    if (_has_weight) return Reading<double>::stale(_last_weight_kg);
    return Reading<double>::unavailable();
  }

  _last_weight_kg = countsToKg(mean);
  _has_weight = true;
  return Reading<double>::valid(_last_weight_kg);
}

bool SensorHub::readBinFull_(uint32_t now_ms) {
  bool active = false;
  if (_src.bin_switch == nullptr || !_src.bin_switch->readActive(active, now_ms)) {
    if (!_bin_switch_warned) {
      AMLAC_LOGW(TAG, "bin switch unavailable, assuming not full");
      _bin_switch_warned = true;
    }
    return false;
  }

  if (_bin_switch_warned) {
    AMLAC_LOGI(TAG, "bin switch available again");
    _bin_switch_warned = false;
  }
  return active;
}

bool SensorHub::tareLoadCell(uint32_t timeout_ms) {
  if (_src.load_cell == nullptr) {
    AMLAC_LOGW(TAG, "tare skipped: no load cell");
    return false;
  }

  const uint32_t start_ms = _clock.nowMs();
  const int needed = _params.load_cell_samples;

  double sum = 0.0;
  int got = 0;

  while (got < needed) {
    const uint32_t now_ms = _clock.nowMs();
    if ((uint32_t)(now_ms - start_ms) >= timeout_ms) {
      AMLAC_LOGW(TAG, "tare timed out (%d/%d samples), keeping offset %.1f",
                 got, needed, _tare_offset);
      return false;
    }

    int32_t raw = 0;
    if (_src.load_cell->readRaw(raw, now_ms)) {
      sum += (double)raw;
      got++;
    } else {
      _clock.sleepMs(TARE_POLL_MS);
    }
  }

  _tare_offset = sum / needed;
  AMLAC_LOGI(TAG, "load cell tared, offset %.1f", _tare_offset);
  return true;
}
