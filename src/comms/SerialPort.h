#pragma once

#include <string>

#include "comms/Stream.h"

/*
===============================================================================
  SerialPort.h
===============================================================================

  PURPOSE
  -------
  POSIX tty wrapped as a non-blocking Stream (raw 8N1, no flow control).

  Used for:
    - the USB serial link to the motor board
    - the NEO-6M GPS UART

  Reads are buffered internally in chunks so read() stays cheap when the
  caller drains byte by byte.
===============================================================================
*/

class SerialPort : public Stream {
public:
  SerialPort(const std::string& path, uint32_t baud);
  ~SerialPort() override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  // Opens and configures the tty. Returns false (and logs) on failure.
  bool open();
  void close();

  bool isOpen() const override { return _fd >= 0; }
  int available() override;
  int read() override;
  bool write(const uint8_t* data, size_t len) override;

  const std::string& path() const { return _path; }

private:
  bool fill_();

  std::string _path;
  uint32_t _baud;
  int _fd = -1;

  uint8_t _buf[256];
  size_t _buf_len = 0;
  size_t _buf_pos = 0;
};
