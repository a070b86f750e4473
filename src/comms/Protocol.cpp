#include "comms/Protocol.h"

/*
===============================================================================
  Protocol.cpp
===============================================================================

  PURPOSE
  -------
  Implements newline-delimited JSON protocol helpers.

  Wire format:
    - One JSON object per line
    - Controller -> Board: type="cmd"
    - Board -> Controller: type="telemetry"

  Notes:
  - Both directions use ArduinoJson; the board firmware uses the same
    library, so field handling matches on both ends.
===============================================================================
*/

#include <ArduinoJson.h>
#include <string.h>

#include "Params.h"


/*=============================================================================
  SMALL HELPERS
=============================================================================*/

static int8_t clampPct(int v) {
  if (v > 100) return 100;
  if (v < -100) return -100;
  return (int8_t)v;
}


namespace protocol {

const char* collectorModeName(CollectorMode mode) {
  return (mode == CollectorMode::RUN) ? "RUN" : "STOP";
}

/*=============================================================================
  ENCODE (Controller -> Board)
=============================================================================*/

std::string encodeCommandLine(const CommandFrame& cmd) {
  StaticJsonDocument<256> doc;

  doc["type"] = "cmd";
  doc["seq"] = cmd.seq;
  doc["host_time_ms"] = cmd.host_time_ms;

  JsonObject drive = doc.createNestedObject("drive");
  drive["left"] = (int)clampPct(cmd.drive.left_pct);
  drive["right"] = (int)clampPct(cmd.drive.right_pct);

  JsonObject mech = doc.createNestedObject("mech");
  mech["collector"] = collectorModeName(cmd.mech.collector);

  std::string line;
  serializeJson(doc, line);
  line.push_back('\n');
  return line;
}


/*=============================================================================
  DECODE (Board -> Controller)
=============================================================================*/

bool decodeTelemetryLine(const char* line, TelemetryFrame& out) {
  out = TelemetryFrame();   // reset everything
  if (!line) return false;

  StaticJsonDocument<SERIAL_JSON_DOC_BYTES> doc;

  if (deserializeJson(doc, line)) {
    return false;
  }

  JsonObject obj = doc.as<JsonObject>();
  if (obj.isNull()) return false;

  // Must be telemetry
  const char* type = obj["type"];
  if (!type || strcmp(type, "telemetry") != 0) return false;

  // Required fields
  if (!obj.containsKey("board_time_ms")) return false;
  if (!obj.containsKey("ack_seq")) return false;

  out.board_time_ms = obj["board_time_ms"].as<uint32_t>();
  out.ack_seq = obj["ack_seq"].as<uint32_t>();

  // ultrasonic (object required, distance nullable)
  JsonObject us = obj["ultrasonic"].as<JsonObject>();
  if (us.isNull()) return false;

  const bool us_valid = us["valid"] | false;
  if (us_valid && us["distance_cm"].is<float>()) {
    out.ultrasonic.valid = true;
    out.ultrasonic.distance_cm = us["distance_cm"].as<float>();
  }

  // load cell (nullable object, raw nullable)
  JsonObject lc = obj["load_cell"].as<JsonObject>();
  if (!lc.isNull() && lc["raw"].is<int32_t>()) {
    out.load_cell.present = true;
    out.load_cell.raw = lc["raw"].as<int32_t>();
  }

  // float switch (nullable)
  if (obj["bin_full"].is<bool>()) {
    out.bin_full_present = true;
    out.bin_full = obj["bin_full"].as<bool>();
  }

  const char* note = obj["note"];
  if (note) {
    strncpy(out.note, note, sizeof(out.note) - 1);
    out.note[sizeof(out.note) - 1] = '\0';
  }

  out.valid = true;
  return true;
}

}  // namespace protocol
