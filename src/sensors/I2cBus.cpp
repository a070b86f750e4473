#include "sensors/I2cBus.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "utils/Log.h"

static const char* TAG = "I2cBus";

// Register address + payload must fit in one write message
static constexpr size_t MAX_WRITE_LEN = 32;

LinuxI2cBus::LinuxI2cBus(const std::string& path, uint32_t timeout_ms)
: _path(path),
  _timeout_ms(timeout_ms) {}

LinuxI2cBus::~LinuxI2cBus() {
  if (_fd >= 0) {
    ::close(_fd);
    _fd = -1;
  }
}

bool LinuxI2cBus::init() {
  if (_fd >= 0) return true;

  _fd = ::open(_path.c_str(), O_RDWR);
  if (_fd < 0) {
    AMLAC_LOGE(TAG, "%s: open failed: %s", _path.c_str(), strerror(errno));
    return false;
  }

  // I2C_TIMEOUT is in units of 10 ms
  unsigned long ticks = (_timeout_ms + 9) / 10;
  if (ticks == 0) ticks = 1;
  if (ioctl(_fd, I2C_TIMEOUT, ticks) != 0) {
    AMLAC_LOGW(TAG, "%s: I2C_TIMEOUT not supported: %s", _path.c_str(), strerror(errno));
  }
  if (ioctl(_fd, I2C_RETRIES, 0UL) != 0) {
    AMLAC_LOGD(TAG, "%s: I2C_RETRIES not supported", _path.c_str());
  }

  AMLAC_LOGI(TAG, "%s ready (timeout %u ms)", _path.c_str(), (unsigned)_timeout_ms);
  return true;
}

bool LinuxI2cBus::write(uint8_t device_addr, uint8_t reg_addr, const uint8_t* data, size_t len) {
  if (_fd < 0) return false;
  if (len + 1 > MAX_WRITE_LEN) return false;

  uint8_t buf[MAX_WRITE_LEN];
  buf[0] = reg_addr;
  if (len > 0) memcpy(buf + 1, data, len);

  struct i2c_msg msg;
  msg.addr = device_addr;
  msg.flags = 0;
  msg.len = (uint16_t)(len + 1);
  msg.buf = buf;

  struct i2c_rdwr_ioctl_data xfer;
  xfer.msgs = &msg;
  xfer.nmsgs = 1;

  return ioctl(_fd, I2C_RDWR, &xfer) == 1;
}

bool LinuxI2cBus::read(uint8_t device_addr, uint8_t reg_addr, uint8_t* data, size_t len) {
  if (_fd < 0 || len == 0) return false;

  uint8_t reg = reg_addr;

  struct i2c_msg msgs[2];
  msgs[0].addr = device_addr;
  msgs[0].flags = 0;
  msgs[0].len = 1;
  msgs[0].buf = &reg;

  msgs[1].addr = device_addr;
  msgs[1].flags = I2C_M_RD; // repeated start
  msgs[1].len = (uint16_t)len;
  msgs[1].buf = data;

  struct i2c_rdwr_ioctl_data xfer;
  xfer.msgs = msgs;
  xfer.nmsgs = 2;

  return ioctl(_fd, I2C_RDWR, &xfer) == 2;
}
