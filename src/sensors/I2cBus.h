#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/*
  I2cBus

  Register-oriented I2C master access. Each call is one bounded transfer;
  false means the transfer failed (NACK, timeout, bus not open).
*/
class I2cBus {
public:
  virtual ~I2cBus() = default;

  virtual bool write(uint8_t device_addr, uint8_t reg_addr, const uint8_t* data, size_t len) = 0;
  virtual bool read(uint8_t device_addr, uint8_t reg_addr, uint8_t* data, size_t len) = 0;
};

/*
  LinuxI2cBus

  /dev/i2c-N through the i2c-dev ioctl interface. Reads use a combined
  write-register / repeated-start / read transaction (I2C_RDWR).
*/
class LinuxI2cBus : public I2cBus {
public:
  LinuxI2cBus(const std::string& path, uint32_t timeout_ms);
  ~LinuxI2cBus() override;

  LinuxI2cBus(const LinuxI2cBus&) = delete;
  LinuxI2cBus& operator=(const LinuxI2cBus&) = delete;

  bool init();
  bool isOpen() const { return _fd >= 0; }

  bool write(uint8_t device_addr, uint8_t reg_addr, const uint8_t* data, size_t len) override;
  bool read(uint8_t device_addr, uint8_t reg_addr, uint8_t* data, size_t len) override;

private:
  std::string _path;
  uint32_t _timeout_ms;
  int _fd = -1;
};
