#include "vision/ImagePrep.h"

#include <cmath>

namespace imageprep {

bool dropAlpha(const Image& in, Image& out) {
  if (in.empty()) return false;

  if (in.channels == 3) {
    out = in;
    return true;
  }
  if (in.channels != 4) return false;

  out.width = in.width;
  out.height = in.height;
  out.channels = 3;
  out.data.resize((size_t)in.width * in.height * 3);

  const size_t pixels = (size_t)in.width * in.height;
  for (size_t i = 0; i < pixels; i++) {
    out.data[i * 3 + 0] = in.data[i * 4 + 0];
    out.data[i * 3 + 1] = in.data[i * 4 + 1];
    out.data[i * 3 + 2] = in.data[i * 4 + 2];
  }
  return true;
}

static int clampIndex(int v, int hi) {
  if (v < 0) return 0;
  if (v > hi) return hi;
  return v;
}

Image resizeBilinear(const Image& in, int width, int height) {
  Image out;
  out.width = width;
  out.height = height;
  out.channels = 3;
  out.data.resize((size_t)width * height * 3);

  const double sx = (double)in.width / width;
  const double sy = (double)in.height / height;

  for (int y = 0; y < height; y++) {
    double fy = (y + 0.5) * sy - 0.5;
    if (fy < 0.0) fy = 0.0;
    const int y0 = clampIndex((int)std::floor(fy), in.height - 1);
    const int y1 = clampIndex(y0 + 1, in.height - 1);
    const double wy = fy - y0;

    for (int x = 0; x < width; x++) {
      double fx = (x + 0.5) * sx - 0.5;
      if (fx < 0.0) fx = 0.0;
      const int x0 = clampIndex((int)std::floor(fx), in.width - 1);
      const int x1 = clampIndex(x0 + 1, in.width - 1);
      const double wx = fx - x0;

      const uint8_t* p00 = in.pixel(x0, y0);
      const uint8_t* p01 = in.pixel(x1, y0);
      const uint8_t* p10 = in.pixel(x0, y1);
      const uint8_t* p11 = in.pixel(x1, y1);

      uint8_t* dst = &out.data[((size_t)y * width + x) * 3];
      for (int c = 0; c < 3; c++) {
        const double top = p00[c] + (p01[c] - p00[c]) * wx;
        const double bot = p10[c] + (p11[c] - p10[c]) * wx;
        const double v = top + (bot - top) * wy;
        dst[c] = (uint8_t)(v + 0.5);
      }
    }
  }
  return out;
}

bool toModelInput(const Image& in, int size, ModelInput& out) {
  if (size <= 0) return false;

  Image rgb;
  if (!dropAlpha(in, rgb)) return false;

  const Image resized = (rgb.width == size && rgb.height == size)
                            ? rgb
                            : resizeBilinear(rgb, size, size);

  out.width = size;
  out.height = size;
  out.data.resize((size_t)size * size * 3);
  for (size_t i = 0; i < out.data.size(); i++) {
    out.data[i] = resized.data[i] / 255.0f;
  }
  return true;
}

}  // namespace imageprep
