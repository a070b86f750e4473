#include "vision/Classifier.h"

#include <chrono>
#include <cmath>
#include <utility>

#include "utils/Log.h"
#include "vision/ImagePrep.h"

static const char* TAG = "Classifier";

const char* classifierStatusName(ClassifierStatus status) {
  switch (status) {
    case ClassifierStatus::OK: return "OK";
    case ClassifierStatus::TIMEOUT: return "TIMEOUT";
    case ClassifierStatus::ERROR: return "ERROR";
    case ClassifierStatus::BUSY: return "BUSY";
    case ClassifierStatus::NO_FRAME: return "NO_FRAME";
    case ClassifierStatus::NO_MODEL: return "NO_MODEL";
    default: return "?";
  }
}

Classifier::Classifier(std::shared_ptr<InferenceModel> model, const ClassifierParams& params)
: _model(std::move(model)),
  _params(params)
{
}

Classifier::~Classifier() {
  stop();
}

bool Classifier::start() {
  if (_slot && _slot->running.load()) return true;
  if (!_model || !_model->isLoaded()) return false;

  // Fresh slot: a worker detached by an earlier stop() keeps the old one
  _slot = std::make_shared<Slot>();
  _slot->model = _model;
  _slot->running.store(true);
  _worker = std::thread(&Classifier::run_, _slot);

  AMLAC_LOGI(TAG, "worker started (deadline %u ms, input %dx%d)",
             (unsigned)_params.deadline_ms, _params.input_size, _params.input_size);
  return true;
}

bool Classifier::stop() {
  if (!_slot || !_slot->running.load()) return true;

  bool idle = false;
  {
    std::unique_lock<std::mutex> lock(_slot->mutex);
    _slot->running.store(false);
    _slot->cv.notify_all();
    idle = _slot->cv.wait_for(lock,
                              std::chrono::milliseconds(_params.stop_timeout_ms),
                              [this]() { return !_slot->in_flight; });
  }

  if (!idle) {
    AMLAC_LOGE(TAG, "inference still running after %u ms, detaching worker",
               (unsigned)_params.stop_timeout_ms);
    _worker.detach();
    return false;
  }

  if (_worker.joinable()) _worker.join();
  return true;
}

void Classifier::run_(std::shared_ptr<Slot> slot) {
  std::unique_lock<std::mutex> lock(slot->mutex);

  while (true) {
    slot->cv.wait(lock, [&slot]() {
      return !slot->running.load() || slot->job_seq != slot->done_seq;
    });

    // Finish a posted job even when stopping so the slot is left consistent
    if (slot->job_seq == slot->done_seq) break;

    const uint32_t seq = slot->job_seq;
    ModelInput input;
    input.width = slot->input.width;
    input.height = slot->input.height;
    input.data.swap(slot->input.data);

    lock.unlock();
    std::vector<float> scores;
    const bool ok = slot->model->infer(input, scores);
    lock.lock();

    slot->scores.swap(scores);
    slot->infer_ok = ok;
    slot->done_seq = seq;
    slot->in_flight = false;
    slot->cv.notify_all();
  }
}

bool Classifier::scoresToVerdict(const std::vector<float>& scores, int positive_class, Verdict& out) {
  if (scores.empty()) return false;
  for (size_t i = 0; i < scores.size(); i++) {
    if (!std::isfinite(scores[i])) return false;
  }

  // Single-output model: the one score is the positive class probability
  if (scores.size() == 1) {
    out.confidence = scores[0];
    out.detected = scores[0] >= 0.5f;
    return true;
  }

  if (positive_class < 0 || (size_t)positive_class >= scores.size()) return false;

  size_t top = 0;
  for (size_t i = 1; i < scores.size(); i++) {
    if (scores[i] > scores[top]) top = i;
  }

  out.confidence = scores[(size_t)positive_class];
  out.detected = (top == (size_t)positive_class);
  return true;
}

ClassifyResult Classifier::classify(const Image& image) {
  ClassifyResult result;

  if (!_slot || !_slot->running.load()) {
    result.status = ClassifierStatus::NO_MODEL;
    return result;
  }
  Slot& slot = *_slot;

  {
    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.in_flight) {
      result.status = ClassifierStatus::BUSY;
      return result;
    }
  }

  ModelInput input;
  if (!imageprep::toModelInput(image, _params.input_size, input)) {
    result.status = ClassifierStatus::NO_FRAME;
    return result;
  }

  std::unique_lock<std::mutex> lock(slot.mutex);
  slot.input = std::move(input);
  const uint32_t seq = ++slot.job_seq;
  slot.in_flight = true;
  slot.cv.notify_all();

  const bool finished = slot.cv.wait_for(lock,
                                         std::chrono::milliseconds(_params.deadline_ms),
                                         [&slot, seq]() { return slot.done_seq == seq; });
  if (!finished) {
    AMLAC_LOGW(TAG, "inference exceeded %u ms deadline", (unsigned)_params.deadline_ms);
    result.status = ClassifierStatus::TIMEOUT;
    return result;
  }

  if (!slot.infer_ok) {
    AMLAC_LOGW(TAG, "model error");
    result.status = ClassifierStatus::ERROR;
    return result;
  }

  if (!scoresToVerdict(slot.scores, _params.positive_class, result.verdict)) {
    AMLAC_LOGW(TAG, "unusable model output (%u scores)", (unsigned)slot.scores.size());
    result.status = ClassifierStatus::ERROR;
    return result;
  }

  result.status = ClassifierStatus::OK;
  AMLAC_LOGD(TAG, "verdict detected=%d confidence=%.3f",
             (int)result.verdict.detected, result.verdict.confidence);
  return result;
}
