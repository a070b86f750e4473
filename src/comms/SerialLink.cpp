#include "comms/SerialLink.h"

#include <string.h>

#include "comms/Protocol.h"
#include "utils/Log.h"

/*
===============================================================================
  SerialLink.cpp
===============================================================================

  Key behavior:
  - Ignores '\r'
  - '\n' ends a frame
  - If RX buffer would overflow, enters "dropping" mode until next '\n'
  - Load cell queue drops the oldest sample when full
===============================================================================
*/

static const char* TAG = "SerialLink";

SerialLink::SerialLink(Stream& serial)
: _serial(serial)
{
  memset(_rx_buf, 0, sizeof(_rx_buf));
  memset(_lc_queue, 0, sizeof(_lc_queue));
  memset(_last_note, 0, sizeof(_last_note));
}

void SerialLink::begin() {
  _rx_len = 0;
  _dropping = false;

  _latest = TelemetryFrame();
  _has_telemetry = false;
  _last_rx_ms = 0;

  clearLoadCellSamples();

  _lines = _ok = _fail = _ovf = 0;

  memset(_rx_buf, 0, sizeof(_rx_buf));
  memset(_last_note, 0, sizeof(_last_note));

  AMLAC_LOGD(TAG, "begin RX_BUF_SIZE=%u", (unsigned)RX_BUF_SIZE);
}

uint32_t SerialLink::telemetryAgeMs(uint32_t now_ms) const {
  if (!_has_telemetry) return 0xFFFFFFFFUL;
  return now_ms - _last_rx_ms;
}

ActuatorStatus SerialLink::sendCommand(const DriveCommand& drive,
                                       const MechanismCommand& mech,
                                       uint32_t now_ms) {
  if (!_serial.isOpen()) return ActuatorStatus::HARDWARE_ABSENT;

  CommandFrame cmd;
  cmd.seq = ++_seq;
  cmd.host_time_ms = now_ms;
  cmd.drive = drive;
  cmd.mech = mech;

  const std::string line = protocol::encodeCommandLine(cmd);
  if (!_serial.write(reinterpret_cast<const uint8_t*>(line.data()), line.size())) {
    AMLAC_LOGW(TAG, "TX FAIL seq=%lu", (unsigned long)cmd.seq);
    return ActuatorStatus::LINK_ERROR;
  }

  AMLAC_LOGD(TAG, "TX seq=%lu drive=%d/%d collector=%s",
             (unsigned long)cmd.seq,
             (int)drive.left_pct,
             (int)drive.right_pct,
             protocol::collectorModeName(mech.collector));
  return ActuatorStatus::OK;
}

bool SerialLink::popLoadCellSample(int32_t& raw) {
  if (_lc_count == 0) return false;
  raw = _lc_queue[_lc_head];
  _lc_head = (_lc_head + 1) % LC_QUEUE_SIZE;
  _lc_count--;
  return true;
}

void SerialLink::pushLoadCell_(int32_t raw) {
  if (_lc_count == LC_QUEUE_SIZE) {
    // Full: drop oldest
    _lc_head = (_lc_head + 1) % LC_QUEUE_SIZE;
    _lc_count--;
  }
  _lc_queue[(_lc_head + _lc_count) % LC_QUEUE_SIZE] = raw;
  _lc_count++;
}

void SerialLink::tick(uint32_t now_ms) {
  while (_serial.available() > 0) {
    int c = _serial.read();
    if (c < 0) break;

    char ch = (char)c;

    if (ch == '\r') continue;

    if (_dropping) {
      // We overflowed earlier; discard until newline to resync
      if (ch == '\n') {
        _dropping = false;
        _rx_len = 0;
      }
      continue;
    }

    if (ch == '\n') {
      // End of frame
      _rx_buf[_rx_len] = '\0';
      _lines++;

      handleLine_(now_ms);

      _rx_len = 0;
      continue;
    }

    // Append to buffer if there is room (leave space for '\0')
    if (_rx_len + 1 < RX_BUF_SIZE) {
      _rx_buf[_rx_len++] = ch;
    } else {
      // Buffer overflow: discard remainder until newline
      _ovf++;
      _dropping = true;
      _rx_len = 0;
      AMLAC_LOGW(TAG, "RX overflow (lines=%lu ovf=%lu), resyncing",
                 (unsigned long)_lines, (unsigned long)_ovf);
    }
  }
}

void SerialLink::handleLine_(uint32_t now_ms) {
  if (_rx_buf[0] == '\0') return;

  TelemetryFrame t;
  if (protocol::decodeTelemetryLine(_rx_buf, t) && t.valid) {
    _latest = t;
    _has_telemetry = true;
    _last_rx_ms = now_ms;
    _ok++;

    if (t.load_cell.present) pushLoadCell_(t.load_cell.raw);

    if (t.note[0] != '\0' && strcmp(t.note, _last_note) != 0) {
      AMLAC_LOGI(TAG, "board: %s", t.note);
      strncpy(_last_note, t.note, sizeof(_last_note) - 1);
    }
  } else {
    _fail++;

    // Show head + length so we can tell if schema/JSON is weird
    AMLAC_LOGD(TAG, "RX FAIL (lines=%lu ok=%lu fail=%lu ovf=%lu) len=%u head=%.24s",
               (unsigned long)_lines,
               (unsigned long)_ok,
               (unsigned long)_fail,
               (unsigned long)_ovf,
               (unsigned)_rx_len,
               _rx_buf);
  }
}
