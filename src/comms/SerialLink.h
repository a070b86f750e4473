#pragma once

#include <cstddef>
#include <cstdint>

#include "Params.h"
#include "actuators/MotorBoard.h"
#include "comms/Messages.h"
#include "comms/Stream.h"

/*
===============================================================================
  SerialLink.h
===============================================================================

  PURPOSE
  -------
  Controller-side serial link to the motor board:

    - Non-blocking read from Stream
    - Accumulate bytes into a newline-delimited line buffer
    - Decode "telemetry" frames and store the latest valid one
    - Queue load cell raw samples (one per telemetry frame) for averaging
    - Encode and send "cmd" frames with an increasing seq

  IMPORTANT
  ---------
  On RX buffer overflow, this class will DISCARD bytes until the next '\n'
  to resynchronize cleanly. This prevents "tail fragments" from being decoded.

===============================================================================
*/

class SerialLink : public MotorBoard {
public:
  explicit SerialLink(Stream& serial);

  void begin();

  // Reads any available bytes and decodes complete lines.
  // Never blocks waiting for input.
  void tick(uint32_t now_ms);

  // MotorBoard
  bool isConnected() const override { return _serial.isOpen(); }
  ActuatorStatus sendCommand(const DriveCommand& drive,
                             const MechanismCommand& mech,
                             uint32_t now_ms) override;

  // True if at least one valid telemetry frame has been received.
  bool hasTelemetry() const { return _has_telemetry; }

  // Latest successfully decoded telemetry (only meaningful if hasTelemetry()).
  const TelemetryFrame& latestTelemetry() const { return _latest; }

  // Time since last telemetry was received (ms). If never received, returns large.
  uint32_t telemetryAgeMs(uint32_t now_ms) const;

  // Oldest unconsumed load cell sample. False if the queue is empty.
  bool popLoadCellSample(int32_t& raw);
  size_t loadCellQueued() const { return _lc_count; }
  void clearLoadCellSamples() { _lc_head = _lc_count = 0; }

  // Last command seq sent / acknowledged by the board
  uint32_t lastSentSeq() const { return _seq; }
  uint32_t ackSeq() const { return _latest.ack_seq; }

  // RX stats
  uint32_t rxLines() const { return _lines; }
  uint32_t rxOk() const { return _ok; }
  uint32_t rxFail() const { return _fail; }
  uint32_t rxOverflow() const { return _ovf; }

private:
  void handleLine_(uint32_t now_ms);
  void pushLoadCell_(int32_t raw);

  Stream& _serial;

  static constexpr size_t RX_BUF_SIZE = SERIAL_LINE_BUFFER_BYTES;
  char _rx_buf[RX_BUF_SIZE];
  size_t _rx_len = 0;

  // When true, we are discarding bytes until newline due to overflow
  bool _dropping = false;

  TelemetryFrame _latest;
  bool _has_telemetry = false;
  uint32_t _last_rx_ms = 0;

  // Load cell sample ring (oldest at _lc_head)
  static constexpr size_t LC_QUEUE_SIZE = LOAD_CELL_QUEUE_DEPTH;
  int32_t _lc_queue[LC_QUEUE_SIZE];
  size_t _lc_head = 0;
  size_t _lc_count = 0;

  uint32_t _seq = 0;

  // Last firmware note, logged once when it changes
  char _last_note[sizeof(TelemetryFrame::note)];

  // RX debug stats
  uint32_t _lines = 0;
  uint32_t _ok = 0;
  uint32_t _fail = 0;
  uint32_t _ovf = 0;
};
