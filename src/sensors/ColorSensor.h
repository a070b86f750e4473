#pragma once

#include <cstdint>

#include "sensors/I2cBus.h"
#include "sensors/SensorSources.h"

/*
===============================================================================
  ColorSensor.h
===============================================================================

  PURPOSE
  -------
  TCS34725 RGB + clear light sensor on I2C.

  Output:
    8-bit RGB, each channel normalized by the clear channel and gamma
    corrected (2.5), matching the Adafruit color_rgb_bytes convention so logs
    compare directly with bench readings.

  If init() failed at startup, readRgb() retries init() once per call so a
  sensor that comes back on the bus is picked up again.
===============================================================================
*/

class ColorSensor : public ColorSource {
public:
  ColorSensor(I2cBus& bus, uint8_t addr);

  bool init();
  bool isReady() const { return _ready; }

  bool readRaw(uint16_t& clear, uint16_t& red, uint16_t& green, uint16_t& blue);
  bool readRgb(Rgb8& out) override;

  static Rgb8 normalize(uint16_t clear, uint16_t red, uint16_t green, uint16_t blue);

private:
  bool writeRegister_(uint8_t reg, uint8_t value);

  I2cBus& _bus;
  uint8_t _addr;
  bool _ready = false;
};
