#pragma once

#include "vision/Image.h"

/*
  ImagePrep

  Turns a captured frame into the classifier input:
    1. drop alpha (RGBA -> RGB)
    2. bilinear resize to size x size
    3. scale to float [0, 1], HWC
*/

namespace imageprep {

// RGBA -> RGB; RGB passes through. False for any other channel count.
bool dropAlpha(const Image& in, Image& out);

// Bilinear resize with pixel-center alignment. Input must be RGB.
Image resizeBilinear(const Image& in, int width, int height);

bool toModelInput(const Image& in, int size, ModelInput& out);

}  // namespace imageprep
