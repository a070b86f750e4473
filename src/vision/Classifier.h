#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "config/RobotConfig.h"
#include "vision/Image.h"
#include "vision/InferenceModel.h"

/*
===============================================================================
  Classifier.h
===============================================================================

  PURPOSE
  -------
  Deadline-bound wrapper around the InferenceModel.

  classify():
    - preprocesses on the calling thread (alpha strip, bilinear resize,
      [0, 1] HWC)
    - hands the input to the worker thread and waits at most deadline_ms
    - returns a Verdict, or a failure status

  A timed-out inference keeps running on the worker. Until it finishes,
  every classify() call returns BUSY without queueing anything.

  stop() waits at most stop_timeout_ms for an in-flight inference. A worker
  still stuck after that is detached; it owns the job slot and the model
  through shared pointers, so it never touches this object again.

  detected = positive class has the top score; confidence = positive class
  score as reported by the model. Thresholding belongs to the ControlLoop.
===============================================================================
*/

enum class ClassifierStatus : uint8_t {
  OK = 0,
  TIMEOUT,    // deadline passed; inference still running
  ERROR,      // model reported an error or produced unusable output
  BUSY,       // previous timed-out inference has not finished yet
  NO_FRAME,   // empty or unusable image
  NO_MODEL,   // no model loaded
};

const char* classifierStatusName(ClassifierStatus status);

struct Verdict {
  bool detected = false;
  double confidence = 0.0;
};

struct ClassifyResult {
  ClassifierStatus status = ClassifierStatus::NO_MODEL;
  Verdict verdict;

  bool ok() const { return status == ClassifierStatus::OK; }
};

// What the ControlLoop calls once per cycle. Implemented by Classifier.
class ImageClassifier {
public:
  virtual ~ImageClassifier() = default;
  virtual ClassifyResult classify(const Image& image) = 0;
};

class Classifier : public ImageClassifier {
public:
  // model may be null or unloaded: every classify() then returns NO_MODEL.
  Classifier(std::shared_ptr<InferenceModel> model, const ClassifierParams& params);
  ~Classifier() override;

  Classifier(const Classifier&) = delete;
  Classifier& operator=(const Classifier&) = delete;

  // False if there is no loaded model.
  bool start();

  // Bounded: returns false if an inference was still running after
  // stop_timeout_ms and the worker had to be detached.
  bool stop();

  ClassifyResult classify(const Image& image) override;

  // Scores -> verdict (exposed for tests).
  static bool scoresToVerdict(const std::vector<float>& scores, int positive_class, Verdict& out);

private:
  // Shared between this object and its worker thread
  struct Slot {
    std::shared_ptr<InferenceModel> model;
    std::atomic_bool running{false};

    std::mutex mutex;
    std::condition_variable cv;

    // Guarded by mutex
    ModelInput input;
    std::vector<float> scores;
    uint32_t job_seq = 0;      // incremented when a job is posted
    uint32_t done_seq = 0;     // set to job_seq when the worker finishes it
    bool infer_ok = false;
    bool in_flight = false;
  };

  static void run_(std::shared_ptr<Slot> slot);

  std::shared_ptr<InferenceModel> _model;
  ClassifierParams _params;

  std::shared_ptr<Slot> _slot;
  std::thread _worker;
};
