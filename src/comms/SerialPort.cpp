#include "comms/SerialPort.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include "utils/Log.h"

/*
===============================================================================
  SerialPort.cpp
===============================================================================

  Key behavior:
  - Opened O_NONBLOCK, so read() never waits
  - write() waits at most WRITE_TIMEOUT_MS for the driver to drain when the
    kernel buffer is full, then reports failure
===============================================================================
*/

static const char* TAG = "SerialPort";

static constexpr int WRITE_TIMEOUT_MS = 50;

static speed_t toSpeed(uint32_t baud) {
  switch (baud) {
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    default:     return B0;
  }
}

SerialPort::SerialPort(const std::string& path, uint32_t baud)
: _path(path),
  _baud(baud)
{
  memset(_buf, 0, sizeof(_buf));
}

SerialPort::~SerialPort() {
  close();
}

bool SerialPort::open() {
  if (_fd >= 0) return true;

  const speed_t speed = toSpeed(_baud);
  if (speed == B0) {
    AMLAC_LOGE(TAG, "%s: unsupported baud %u", _path.c_str(), (unsigned)_baud);
    return false;
  }

  _fd = ::open(_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (_fd < 0) {
    AMLAC_LOGE(TAG, "%s: open failed: %s", _path.c_str(), strerror(errno));
    return false;
  }

  struct termios tio;
  if (tcgetattr(_fd, &tio) != 0) {
    AMLAC_LOGE(TAG, "%s: tcgetattr failed: %s", _path.c_str(), strerror(errno));
    close();
    return false;
  }

  cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS;
  tio.c_cflag &= ~CSTOPB;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);

  if (tcsetattr(_fd, TCSANOW, &tio) != 0) {
    AMLAC_LOGE(TAG, "%s: tcsetattr failed: %s", _path.c_str(), strerror(errno));
    close();
    return false;
  }

  tcflush(_fd, TCIOFLUSH);
  _buf_len = _buf_pos = 0;

  AMLAC_LOGI(TAG, "%s open at %u baud", _path.c_str(), (unsigned)_baud);
  return true;
}

void SerialPort::close() {
  if (_fd < 0) return;
  ::close(_fd);
  _fd = -1;
  _buf_len = _buf_pos = 0;
}

bool SerialPort::fill_() {
  if (_fd < 0) return false;

  const ssize_t n = ::read(_fd, _buf, sizeof(_buf));
  if (n > 0) {
    _buf_len = (size_t)n;
    _buf_pos = 0;
    return true;
  }

  if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
    AMLAC_LOGW(TAG, "%s: read failed: %s", _path.c_str(), strerror(errno));
  }
  return false;
}

int SerialPort::available() {
  if (_fd < 0) return 0;

  int pending = 0;
  if (ioctl(_fd, FIONREAD, &pending) != 0) pending = 0;

  return (int)(_buf_len - _buf_pos) + pending;
}

int SerialPort::read() {
  if (_buf_pos >= _buf_len) {
    if (!fill_()) return -1;
  }
  return _buf[_buf_pos++];
}

bool SerialPort::write(const uint8_t* data, size_t len) {
  if (_fd < 0) return false;

  size_t sent = 0;
  while (sent < len) {
    const ssize_t n = ::write(_fd, data + sent, len - sent);
    if (n > 0) {
      sent += (size_t)n;
      continue;
    }

    if (n < 0 && errno == EINTR) continue;

    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd;
      pfd.fd = _fd;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      if (poll(&pfd, 1, WRITE_TIMEOUT_MS) > 0) continue;
      AMLAC_LOGW(TAG, "%s: write timed out", _path.c_str());
      return false;
    }

    AMLAC_LOGW(TAG, "%s: write failed: %s", _path.c_str(), strerror(errno));
    return false;
  }
  return true;
}
