#pragma once
#include <cstdint>

/*
  Devices.h

  Purpose:
  Central location for every hardware endpoint the controller opens.
  Keeps the Pi-side wiring explicit, readable, and easy to modify.

  Notes:
  - I2C bus 1 is the header bus (GPIO 2 = SDA, GPIO 3 = SCL)
  - The motor board enumerates as a USB CDC device
  - GPS uses the Pi primary UART
  - Ultrasonic, HX711, float switch, paddle motors and conveyor stepper are
    wired to the motor board, not to the Pi
*/

/* ============================================================================
   I2C
============================================================================ */

constexpr const char* I2C_BUS_PATH = "/dev/i2c-1";

constexpr uint8_t TCS34725_I2C_ADDRESS = 0x29;
constexpr uint8_t MPU6050_I2C_ADDRESS = 0x68;

/* ============================================================================
   SERIAL PORTS
============================================================================ */

// USB serial (Pi <-> motor board)
constexpr const char* BOARD_SERIAL_PATH = "/dev/ttyACM0";
constexpr uint32_t BOARD_SERIAL_BAUD = 230400;

// NEO-6M GPS
constexpr const char* GPS_SERIAL_PATH = "/dev/serial0";
constexpr uint32_t GPS_SERIAL_BAUD = 9600;

/* ============================================================================
   CAMERA
============================================================================ */

// Latest frame published by the capture process (binary PPM)
constexpr const char* CAMERA_FRAME_PATH = "/run/amlac/frame.ppm";
