#pragma once

#include <cstddef>
#include <cstdint>

/*
  Stream

  Minimal non-blocking byte stream, shaped after the Arduino Stream the
  board firmware reads from: available() / read() never wait, write()
  pushes the whole buffer or fails.

  Implemented by SerialPort (termios) and by test fakes.
*/

class Stream {
public:
  virtual ~Stream() = default;

  // True if the underlying device is open and usable.
  virtual bool isOpen() const = 0;

  // Number of bytes that can be read without blocking.
  virtual int available() = 0;

  // Next byte, or -1 if none is available right now.
  virtual int read() = 0;

  // Writes len bytes. Returns false if the device is closed or the write failed.
  virtual bool write(const uint8_t* data, size_t len) = 0;
};
