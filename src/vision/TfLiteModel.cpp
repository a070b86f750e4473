#include "vision/TfLiteModel.h"

#include <cmath>
#include <cstdint>
#include <utility>

#include "tensorflow/lite/kernels/register.h"

#include "utils/Log.h"

static const char* TAG = "TfLiteModel";

TfLiteModel::TfLiteModel(int threads)
: _threads(threads)
{
}

TfLiteModel::~TfLiteModel() = default;

void TfLiteModel::reset_() {
  _interpreter.reset();
  _model.reset();
  _width = 0;
  _height = 0;
}

bool TfLiteModel::load(const std::string& path) {
  reset_();

  std::unique_ptr<tflite::FlatBufferModel> model =
      tflite::FlatBufferModel::BuildFromFile(path.c_str());
  if (!model) {
    AMLAC_LOGE(TAG, "cannot read model %s", path.c_str());
    return false;
  }

  tflite::ops::builtin::BuiltinOpResolver resolver;
  std::unique_ptr<tflite::Interpreter> interpreter;
  if (tflite::InterpreterBuilder(*model, resolver)(&interpreter) != kTfLiteOk || !interpreter) {
    AMLAC_LOGE(TAG, "cannot build interpreter for %s", path.c_str());
    return false;
  }

  if (_threads > 0) interpreter->SetNumThreads(_threads);

  if (interpreter->AllocateTensors() != kTfLiteOk) {
    AMLAC_LOGE(TAG, "tensor allocation failed");
    return false;
  }

  if (interpreter->inputs().size() != 1 || interpreter->outputs().empty()) {
    AMLAC_LOGE(TAG, "expected one input tensor, got %u", (unsigned)interpreter->inputs().size());
    return false;
  }

  // [1, h, w, 3]
  const TfLiteTensor* in = interpreter->input_tensor(0);
  if (in->dims->size != 4 || in->dims->data[0] != 1 || in->dims->data[3] != 3) {
    AMLAC_LOGE(TAG, "unsupported input shape (rank %d)", in->dims->size);
    return false;
  }
  if (in->dims->data[1] != in->dims->data[2]) {
    AMLAC_LOGE(TAG, "input %dx%d is not square", in->dims->data[2], in->dims->data[1]);
    return false;
  }
  if (in->type != kTfLiteFloat32 && in->type != kTfLiteUInt8) {
    AMLAC_LOGE(TAG, "unsupported input type %d", (int)in->type);
    return false;
  }

  const TfLiteTensor* out = interpreter->output_tensor(0);
  if (out->type != kTfLiteFloat32 && out->type != kTfLiteUInt8) {
    AMLAC_LOGE(TAG, "unsupported output type %d", (int)out->type);
    return false;
  }

  _height = in->dims->data[1];
  _width = in->dims->data[2];
  _model = std::move(model);
  _interpreter = std::move(interpreter);

  AMLAC_LOGI(TAG, "loaded %s (input %dx%d %s)", path.c_str(), _width, _height,
             in->type == kTfLiteUInt8 ? "uint8" : "float32");
  return true;
}

bool TfLiteModel::infer(const ModelInput& input, std::vector<float>& scores) {
  if (!_interpreter) return false;
  if (input.width != _width || input.height != _height) {
    AMLAC_LOGW(TAG, "input %dx%d does not match model %dx%d",
               input.width, input.height, _width, _height);
    return false;
  }

  TfLiteTensor* in = _interpreter->input_tensor(0);
  const size_t count = (size_t)_width * _height * 3;
  if (input.data.size() != count) return false;

  if (in->type == kTfLiteFloat32) {
    float* dst = _interpreter->typed_input_tensor<float>(0);
    for (size_t i = 0; i < count; i++) dst[i] = input.data[i];
  } else {
    // Quantized model: q = v / scale + zero_point
    uint8_t* dst = _interpreter->typed_input_tensor<uint8_t>(0);
    const float scale = in->params.scale > 0.0f ? in->params.scale : 1.0f / 255.0f;
    const int zero = in->params.zero_point;
    for (size_t i = 0; i < count; i++) {
      long q = std::lround(input.data[i] / scale) + zero;
      if (q < 0) q = 0;
      if (q > 255) q = 255;
      dst[i] = (uint8_t)q;
    }
  }

  if (_interpreter->Invoke() != kTfLiteOk) {
    AMLAC_LOGW(TAG, "invoke failed");
    return false;
  }

  // First row of output 0
  const TfLiteTensor* out = _interpreter->output_tensor(0);
  const int classes = out->dims->size > 0 ? out->dims->data[out->dims->size - 1] : 0;
  if (classes <= 0) return false;

  scores.resize((size_t)classes);
  if (out->type == kTfLiteFloat32) {
    const float* src = _interpreter->typed_output_tensor<float>(0);
    for (int i = 0; i < classes; i++) scores[(size_t)i] = src[i];
  } else {
    const uint8_t* src = _interpreter->typed_output_tensor<uint8_t>(0);
    for (int i = 0; i < classes; i++) {
      scores[(size_t)i] = out->params.scale * (float)((int)src[i] - out->params.zero_point);
    }
  }
  return true;
}
