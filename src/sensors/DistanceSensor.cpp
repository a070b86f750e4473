#include "sensors/DistanceSensor.h"

/*
  DistanceSensor.cpp

  Responsibilities:
  - Pull any pending telemetry off the board link
  - Validate the board's ultrasonic reading (flag, range, age)
  - Store the latest state for debug output

  The board reports invalid echoes (timeout, no return) with valid=false.
*/

DistanceSensor::DistanceSensor(SerialLink& link,
                               double min_cm,
                               double max_cm,
                               uint32_t max_age_ms)
: _link(link),
  _min_cm(min_cm),
  _max_cm(max_cm),
  _max_age_ms(max_age_ms)
{
}

void DistanceSensor::setLimits(double min_cm, double max_cm, uint32_t max_age_ms) {
  _min_cm = min_cm;
  _max_cm = max_cm;
  _max_age_ms = max_age_ms;
}

bool DistanceSensor::readDistanceCm(double& out, uint32_t now_ms) {
  if (!measure_(now_ms)) return false;
  out = _state.distance_cm;
  return true;
}

bool DistanceSensor::measure_(uint32_t now_ms) {
  _link.tick(now_ms);

  _state.last_update_ms = now_ms;
  _state.valid = false;

  if (!_link.hasTelemetry()) return false;
  if (_link.telemetryAgeMs(now_ms) > _max_age_ms) return false;

  const UltrasonicTelemetry& us = _link.latestTelemetry().ultrasonic;
  if (!us.valid) return false;

  const double cm = (double)us.distance_cm;
  if (cm < _min_cm || cm > _max_cm) return false;

  _state.distance_cm = cm;
  _state.valid = true;
  return true;
}
