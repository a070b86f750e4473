#include "sensors/ColorSensor.h"

#include <cmath>

#include "utils/Log.h"

static const char* TAG = "ColorSensor";

// Command byte: bit7 = command, bits6:5 = 01 auto-increment
static constexpr uint8_t CMD_BIT      = 0x80;
static constexpr uint8_t CMD_AUTO_INC = 0xA0;

// TCS34725 registers
static constexpr uint8_t REG_ENABLE  = 0x00;
static constexpr uint8_t REG_ATIME   = 0x01;
static constexpr uint8_t REG_CONTROL = 0x0F;
static constexpr uint8_t REG_ID      = 0x12;
static constexpr uint8_t REG_CDATAL  = 0x14;

static constexpr uint8_t ENABLE_PON = 0x01;
static constexpr uint8_t ENABLE_AEN = 0x02;

static constexpr uint8_t ATIME_50MS = 0xEB;   // (256 - 0xEB) * 2.4 ms
static constexpr uint8_t GAIN_4X    = 0x01;

static constexpr double GAMMA = 2.5;

ColorSensor::ColorSensor(I2cBus& bus, uint8_t addr)
: _bus(bus),
  _addr(addr)
{
}

bool ColorSensor::writeRegister_(uint8_t reg, uint8_t value) {
  return _bus.write(_addr, CMD_BIT | reg, &value, 1);
}

bool ColorSensor::init() {
  uint8_t id = 0;
  if (!_bus.read(_addr, CMD_BIT | REG_ID, &id, 1)) {
    AMLAC_LOGW(TAG, "no response at 0x%02X", _addr);
    _ready = false;
    return false;
  }

  // 0x44 = TCS34721/5, 0x4D = TCS34723/7
  if (id != 0x44 && id != 0x4D) {
    AMLAC_LOGW(TAG, "unexpected ID 0x%02X", id);
  }

  if (!writeRegister_(REG_ATIME, ATIME_50MS) ||
      !writeRegister_(REG_CONTROL, GAIN_4X) ||
      !writeRegister_(REG_ENABLE, ENABLE_PON) ||
      !writeRegister_(REG_ENABLE, ENABLE_PON | ENABLE_AEN)) {
    AMLAC_LOGW(TAG, "configuration write failed");
    _ready = false;
    return false;
  }

  AMLAC_LOGI(TAG, "TCS34725 ready (ID 0x%02X)", id);
  _ready = true;
  return true;
}

bool ColorSensor::readRaw(uint16_t& clear, uint16_t& red, uint16_t& green, uint16_t& blue) {
  uint8_t buf[8];
  if (!_bus.read(_addr, CMD_AUTO_INC | REG_CDATAL, buf, sizeof(buf))) {
    return false;
  }

  // Little endian: C, R, G, B
  clear = (uint16_t)(buf[0] | (buf[1] << 8));
  red   = (uint16_t)(buf[2] | (buf[3] << 8));
  green = (uint16_t)(buf[4] | (buf[5] << 8));
  blue  = (uint16_t)(buf[6] | (buf[7] << 8));
  return true;
}

bool ColorSensor::readRgb(Rgb8& out) {
  if (!_ready && !init()) return false;

  uint16_t c, r, g, b;
  if (!readRaw(c, r, g, b)) return false;

  out = normalize(c, r, g, b);
  return true;
}

static uint8_t channelByte(uint16_t value, uint16_t clear) {
  const double ratio = (double)(int)(((double)value / clear) * 256.0) / 255.0;
  const int v = (int)(std::pow(ratio, GAMMA) * 255.0);
  if (v > 255) return 255;
  if (v < 0) return 0;
  return (uint8_t)v;
}

Rgb8 ColorSensor::normalize(uint16_t clear, uint16_t red, uint16_t green, uint16_t blue) {
  Rgb8 out;
  if (clear == 0) return out;   // dark: black

  out.r = channelByte(red, clear);
  out.g = channelByte(green, clear);
  out.b = channelByte(blue, clear);
  return out;
}
