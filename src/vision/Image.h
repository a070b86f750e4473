#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

/*
  Image / ModelInput

  Image: 8-bit interleaved pixels, row-major, channels = 3 (RGB) or 4 (RGBA).
  ModelInput: float32 HWC RGB in [0, 1], the layout the classifier expects.
*/

struct Image {
  int width = 0;
  int height = 0;
  int channels = 0;
  std::vector<uint8_t> data;

  bool empty() const {
    return width <= 0 || height <= 0 || channels <= 0 ||
           data.size() < (size_t)width * height * channels;
  }

  const uint8_t* pixel(int x, int y) const {
    return &data[((size_t)y * width + x) * channels];
  }
};

struct ModelInput {
  int width = 0;
  int height = 0;
  std::vector<float> data;   // width * height * 3
};
