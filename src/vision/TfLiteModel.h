#pragma once

#include <memory>
#include <string>
#include <vector>

#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/model.h"

#include "vision/InferenceModel.h"

/*
===============================================================================
  TfLiteModel.h
===============================================================================

  PURPOSE
  -------
  InferenceModel backed by the TensorFlow Lite interpreter, for the image
  model exported by Teachable Machine.

  load():
    - reads the .tflite file and allocates tensors
    - accepts one input tensor [1, h, w, 3], float32 or uint8
    - the ModelInput fed to infer() must be w x h; inputSize() reports w so
      the Classifier resizes to it

  infer() copies the [0, 1] input into the input tensor (quantizing for
  uint8 models) and returns the first output row as scores, dequantized
  when the output is uint8.
===============================================================================
*/

class TfLiteModel : public InferenceModel {
public:
  explicit TfLiteModel(int threads);
  ~TfLiteModel() override;

  TfLiteModel(const TfLiteModel&) = delete;
  TfLiteModel& operator=(const TfLiteModel&) = delete;

  // False if the file is missing, unparseable or has an unsupported input.
  bool load(const std::string& path);

  bool isLoaded() const override { return _interpreter != nullptr; }

  // Square input side in pixels, 0 before load().
  int inputSize() const { return _width; }

  bool infer(const ModelInput& input, std::vector<float>& scores) override;

private:
  void reset_();

  int _threads;
  int _width = 0;
  int _height = 0;

  std::unique_ptr<tflite::FlatBufferModel> _model;
  std::unique_ptr<tflite::Interpreter> _interpreter;
};
