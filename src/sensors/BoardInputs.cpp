#include "sensors/BoardInputs.h"

bool BoardLoadCell::readRaw(int32_t& out, uint32_t now_ms) {
  _link.tick(now_ms);
  return _link.popLoadCellSample(out);
}

bool BoardBinSwitch::readActive(bool& active, uint32_t now_ms) {
  _link.tick(now_ms);

  if (!_link.hasTelemetry()) return false;
  if (_link.telemetryAgeMs(now_ms) > _max_age_ms) return false;

  const TelemetryFrame& t = _link.latestTelemetry();
  if (!t.bin_full_present) return false;

  active = t.bin_full;
  return true;
}
