#pragma once

#include <cstdint>

#include "Params.h"
#include "sensors/SensorTypes.h"

/*
===============================================================================
  DisplayEvent.h
===============================================================================

  PURPOSE
  -------
  Content contract for the 16x2 character panel. Every event is two lines of
  at most DISPLAY_COLUMNS characters, already formatted.

  Kinds and how the DisplaySink treats them:
    ALERT   (detection, error, bin full, obstacle, shutdown)
            rendered at once, then hold the panel for alert_hold_ms
    STATUS  (startup, ready)
            rendered at once unless an alert is holding the panel
    ROUTINE (scanning, position, weight)
            rendered on the refresh cadence, never over a holding alert
===============================================================================
*/

enum class DisplayKind : uint8_t {
  STARTUP = 0,
  READY,
  SCANNING,
  POSITION,
  WEIGHT,
  DETECTION,
  OBSTACLE,
  ERROR,
  BIN_FULL,
  SHUTDOWN,
};

enum class DisplayPriority : uint8_t {
  ROUTINE = 0,
  STATUS,
  ALERT,
};

struct DisplayEvent {
  DisplayKind kind = DisplayKind::SCANNING;
  char line1[DISPLAY_COLUMNS + 1] = {0};
  char line2[DISPLAY_COLUMNS + 1] = {0};
};

const char* displayKindName(DisplayKind kind);
DisplayPriority displayPriority(DisplayKind kind);

namespace display {

DisplayEvent startup();
DisplayEvent ready();
DisplayEvent scanning(uint64_t collection_count);
DisplayEvent detection(double confidence, uint64_t collection_count);

// has_fix false -> "GPS:" / "No Fix"
DisplayEvent position(bool has_fix, const GeoPoint& fix);
DisplayEvent weight(double kg);
DisplayEvent obstacle(double distance_cm);

// message truncated to one panel line
DisplayEvent error(const char* message);
DisplayEvent binFull();
DisplayEvent shutdown();

}  // namespace display
