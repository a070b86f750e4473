#include "sensors/ImuSensor.h"

#include <cmath>

#include "utils/Log.h"

static const char* TAG = "ImuSensor";

// MPU6050 registers
static constexpr uint8_t REG_CONFIG       = 0x1A;
static constexpr uint8_t REG_ACCEL_CONFIG = 0x1C;
static constexpr uint8_t REG_ACCEL_XOUT_H = 0x3B;
static constexpr uint8_t REG_PWR_MGMT_1   = 0x6B;
static constexpr uint8_t REG_WHO_AM_I     = 0x75;

// Scale factor for the default +-2 g range
static constexpr double ACCEL_LSB_2G = 16384.0;   // LSB/g

static constexpr double RAD_TO_DEG = 57.29577951308232;

ImuSensor::ImuSensor(I2cBus& bus, uint8_t addr)
: _bus(bus),
  _addr(addr)
{
}

bool ImuSensor::writeRegister_(uint8_t reg, uint8_t value) {
  return _bus.write(_addr, reg, &value, 1);
}

bool ImuSensor::init() {
  uint8_t who = 0;
  if (!_bus.read(_addr, REG_WHO_AM_I, &who, 1)) {
    AMLAC_LOGW(TAG, "no response at 0x%02X", _addr);
    _ready = false;
    return false;
  }

  // Wake device (clear sleep), DLPF ~44 Hz, +-2 g
  if (!writeRegister_(REG_PWR_MGMT_1, 0x00) ||
      !writeRegister_(REG_CONFIG, 0x03) ||
      !writeRegister_(REG_ACCEL_CONFIG, 0x00)) {
    AMLAC_LOGW(TAG, "configuration write failed");
    _ready = false;
    return false;
  }

  AMLAC_LOGI(TAG, "MPU6050 ready (WHO_AM_I 0x%02X)", who);
  _ready = true;
  return true;
}

bool ImuSensor::readAcceleration(double& ax, double& ay, double& az) {
  uint8_t buf[6];
  if (!_bus.read(_addr, REG_ACCEL_XOUT_H, buf, sizeof(buf))) {
    return false;
  }

  const int16_t x = (int16_t)((buf[0] << 8) | buf[1]);
  const int16_t y = (int16_t)((buf[2] << 8) | buf[3]);
  const int16_t z = (int16_t)((buf[4] << 8) | buf[5]);

  ax = x / ACCEL_LSB_2G;
  ay = y / ACCEL_LSB_2G;
  az = z / ACCEL_LSB_2G;
  return true;
}

bool ImuSensor::readOrientation(Orientation& out) {
  if (!_ready && !init()) return false;

  double ax, ay, az;
  if (!readAcceleration(ax, ay, az)) return false;

  out = tiltFromAccel(ax, ay, az);
  return true;
}

Orientation ImuSensor::tiltFromAccel(double ax, double ay, double az) {
  Orientation o;
  o.pitch_deg = std::atan2(ay, std::sqrt(ax * ax + az * az)) * RAD_TO_DEG;
  o.roll_deg = std::atan2(-ax, az) * RAD_TO_DEG;
  return o;
}
