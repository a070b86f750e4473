#pragma once

#include <string>

#include "vision/Image.h"

/*
  Camera

  Source of the frame classified each cycle. capture() returns false when no
  frame is available; it never blocks waiting for one.
*/

class Camera {
public:
  virtual ~Camera() = default;
  virtual bool capture(Image& out) = 0;
};

/*
  PpmFileCamera

  Reads the latest frame published by the external capture pipeline as a
  binary PPM (P6, maxval 255). The pipeline replaces the file atomically
  (write + rename), so a read always sees a whole frame.
*/
class PpmFileCamera : public Camera {
public:
  explicit PpmFileCamera(const std::string& path) : _path(path) {}

  bool capture(Image& out) override;

  // Parses an in-memory P6 image. Exposed for tests.
  static bool decodePpm(const std::vector<uint8_t>& bytes, Image& out);

private:
  std::string _path;
};
