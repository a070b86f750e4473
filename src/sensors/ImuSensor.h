#pragma once

#include <cstdint>

#include "sensors/I2cBus.h"
#include "sensors/SensorSources.h"

/*
  ImuSensor

  MPU6050 on I2C, used only for tilt. Accelerometer at +-2 g; pitch and
  roll come from the gravity vector:
    pitch = atan2(ay, sqrt(ax^2 + az^2))
    roll  = atan2(-ax, az)
*/
class ImuSensor : public OrientationSource {
public:
  ImuSensor(I2cBus& bus, uint8_t addr);

  bool init();
  bool isReady() const { return _ready; }

  // Acceleration in g
  bool readAcceleration(double& ax, double& ay, double& az);

  bool readOrientation(Orientation& out) override;

  static Orientation tiltFromAccel(double ax, double ay, double az);

private:
  bool writeRegister_(uint8_t reg, uint8_t value);

  I2cBus& _bus;
  uint8_t _addr;
  bool _ready = false;
};
