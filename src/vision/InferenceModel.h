#pragma once

#include <vector>

#include "vision/Image.h"

/*
  InferenceModel

  The trained classifier behind a narrow boundary. infer() runs on the
  Classifier's worker thread, one call at a time, and may take arbitrarily
  long; the Classifier enforces the deadline.

  scores: one value per class, in model output order.
*/

class InferenceModel {
public:
  virtual ~InferenceModel() = default;

  virtual bool isLoaded() const = 0;

  // False on any runtime error.
  virtual bool infer(const ModelInput& input, std::vector<float>& scores) = 0;
};
