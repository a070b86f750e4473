#pragma once

#include <cstdint>

#include "comms/SerialLink.h"
#include "sensors/SensorSources.h"

/*
  DistanceSensor

  JSN-SR04T ultrasonic ranger. The motor board triggers the pulse and times
  the echo; this class validates the distance carried by the latest
  telemetry frame.

  A reading is accepted only if:
    - the board marked it valid
    - it is within [min_cm, max_cm]
    - the telemetry frame is at most max_age_ms old
*/

class DistanceSensor : public RangeSource {
public:
  struct State {
    double distance_cm = -1.0;      // last accepted distance (-1 if none)
    bool valid = false;             // last reading valid?
    uint32_t last_update_ms = 0;    // when the last reading was evaluated
  };

  DistanceSensor(SerialLink& link,
                 double min_cm,
                 double max_cm,
                 uint32_t max_age_ms);

  bool readDistanceCm(double& out, uint32_t now_ms) override;

  void setLimits(double min_cm, double max_cm, uint32_t max_age_ms);

  const State& getState() const { return _state; }

private:
  bool measure_(uint32_t now_ms);

  SerialLink& _link;

  double _min_cm;
  double _max_cm;
  uint32_t _max_age_ms;

  State _state;
};
