#include "present/DisplayEvent.h"

#include <cstdarg>
#include <cstdio>

const char* displayKindName(DisplayKind kind) {
  switch (kind) {
    case DisplayKind::STARTUP: return "STARTUP";
    case DisplayKind::READY: return "READY";
    case DisplayKind::SCANNING: return "SCANNING";
    case DisplayKind::POSITION: return "POSITION";
    case DisplayKind::WEIGHT: return "WEIGHT";
    case DisplayKind::DETECTION: return "DETECTION";
    case DisplayKind::OBSTACLE: return "OBSTACLE";
    case DisplayKind::ERROR: return "ERROR";
    case DisplayKind::BIN_FULL: return "BIN_FULL";
    case DisplayKind::SHUTDOWN: return "SHUTDOWN";
    default: return "?";
  }
}

DisplayPriority displayPriority(DisplayKind kind) {
  switch (kind) {
    case DisplayKind::DETECTION:
    case DisplayKind::OBSTACLE:
    case DisplayKind::ERROR:
    case DisplayKind::BIN_FULL:
    case DisplayKind::SHUTDOWN:
      return DisplayPriority::ALERT;
    case DisplayKind::STARTUP:
    case DisplayKind::READY:
      return DisplayPriority::STATUS;
    default:
      return DisplayPriority::ROUTINE;
  }
}

namespace display {

// snprintf truncates to the panel width
static void fmtLine(char (&line)[DISPLAY_COLUMNS + 1], const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

static void fmtLine(char (&line)[DISPLAY_COLUMNS + 1], const char* fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
}

static DisplayEvent make(DisplayKind kind, const char* l1, const char* l2) {
  DisplayEvent e;
  e.kind = kind;
  fmtLine(e.line1, "%s", l1);
  fmtLine(e.line2, "%s", l2);
  return e;
}

DisplayEvent startup() {
  return make(DisplayKind::STARTUP, "AMLAC Robot", "Starting...");
}

DisplayEvent ready() {
  return make(DisplayKind::READY, "System Ready", "");
}

DisplayEvent scanning(uint64_t collection_count) {
  DisplayEvent e;
  e.kind = DisplayKind::SCANNING;
  fmtLine(e.line1, "Scanning...");
  fmtLine(e.line2, "Collected: %llu", (unsigned long long)collection_count);
  return e;
}

DisplayEvent detection(double confidence, uint64_t collection_count) {
  DisplayEvent e;
  e.kind = DisplayKind::DETECTION;
  fmtLine(e.line1, "ALGAE DETECTED!");
  fmtLine(e.line2, "Cnt:%llu C:%d%%", (unsigned long long)collection_count, (int)(confidence * 100.0));
  return e;
}

DisplayEvent position(bool has_fix, const GeoPoint& fix) {
  if (!has_fix) return make(DisplayKind::POSITION, "GPS:", "No Fix");

  DisplayEvent e;
  e.kind = DisplayKind::POSITION;
  fmtLine(e.line1, "Lat: %.4f", fix.lat);
  fmtLine(e.line2, "Lon: %.4f", fix.lon);
  return e;
}

DisplayEvent weight(double kg) {
  DisplayEvent e;
  e.kind = DisplayKind::WEIGHT;
  fmtLine(e.line1, "Total Collected");
  fmtLine(e.line2, "%.2f kg", kg);
  return e;
}

DisplayEvent obstacle(double distance_cm) {
  DisplayEvent e;
  e.kind = DisplayKind::OBSTACLE;
  fmtLine(e.line1, "OBSTACLE!");
  fmtLine(e.line2, "Distance: %.0fcm", distance_cm);
  return e;
}

DisplayEvent error(const char* message) {
  return make(DisplayKind::ERROR, "ERROR!", message ? message : "");
}

DisplayEvent binFull() {
  return make(DisplayKind::BIN_FULL, "*** WARNING ***", "BIN FULL!");
}

DisplayEvent shutdown() {
  return make(DisplayKind::SHUTDOWN, "Shutting Down", "Goodbye!");
}

}  // namespace display
