#pragma once

#include <cstdint>

#include "comms/SerialLink.h"
#include "sensors/SensorSources.h"

/*
  BoardInputs

  Sensor sources wired to the motor board and delivered in telemetry:
    - BoardLoadCell: HX711 raw samples, one per telemetry frame, queued by
      SerialLink and consumed oldest first
    - BoardBinSwitch: float switch state from the latest telemetry frame
*/

class BoardLoadCell : public LoadCellSource {
public:
  explicit BoardLoadCell(SerialLink& link) : _link(link) {}

  bool readRaw(int32_t& out, uint32_t now_ms) override;

private:
  SerialLink& _link;
};

class BoardBinSwitch : public SwitchSource {
public:
  BoardBinSwitch(SerialLink& link, uint32_t max_age_ms)
  : _link(link), _max_age_ms(max_age_ms) {}

  bool readActive(bool& active, uint32_t now_ms) override;

private:
  SerialLink& _link;
  uint32_t _max_age_ms;
};
