#pragma once

#include <cstdint>
#include <string>

#include "actuators/ActuatorDriver.h"
#include "config/RobotConfig.h"
#include "control/RobotState.h"
#include "present/CollectionLog.h"
#include "present/DisplaySink.h"
#include "sensors/SensorHub.h"
#include "utils/Clock.h"
#include "utils/Hold.h"
#include "utils/Rate.h"
#include "vision/Camera.h"
#include "vision/Classifier.h"

/*
===============================================================================
  ControlLoop.h
===============================================================================

  PURPOSE
  -------
  The cyclic orchestrator. One cycle:

    capture -> classify -> poll sensors -> decide -> actuate
            -> present / log -> sleep to cadence

  Decision precedence (highest first):
    1. Fault      actuator failure or exception during the cycle
                  stopAll, error page, fault backoff hold
    2. Bin full   stopAll, bin-full page, cool-down hold, back to SCANNING
    3. Obstacle   (if enabled) stop, turn right for obstacle_turn_ms, stop
    4. Detection  detected && confidence > threshold:
                  collector on, collection hold, collector off, count + log
    5. Idle       post the rotating page (scanning / position / weight)

  A classifier failure counts as "not detected". Absent sensor fields are
  tolerated. FAULT and BIN_FULL never survive into the next cycle's decision;
  leaving FAULT re-sends stopAll() and needs the board to accept it.

  Cancellation is checked between cycles and at every hold slice. run()
  then calls stopAll() once, shows the shutdown page, logs statistics and
  returns the exit code (1 if cancelled while in FAULT, else 0).
===============================================================================
*/

struct LoopCounters {
  uint64_t cycles = 0;
  uint64_t faults = 0;
  uint64_t classifier_failures = 0;
  uint64_t bin_full_events = 0;
  uint64_t obstacle_events = 0;
  uint64_t log_failures = 0;
};

class ControlLoop {
public:
  ControlLoop(Camera& camera,
              ImageClassifier& classifier,
              SensorHub& sensors,
              ActuatorDriver& actuators,
              DisplaySink& display,
              CollectionLog& log,
              Clock& clock,
              const CancelToken& cancel,
              const ControlParams& params);

  // Runs one full cycle including its holds and the wait to cadence.
  // Returns false once cancellation has been observed.
  bool runCycle();

  // Runs cycles until cancelled, then shuts down. Returns the exit code.
  int run();

  // stopAll + shutdown page + statistics. Runs at most once.
  void shutdown();

  RobotState state() const { return _state; }
  uint64_t collectionCount() const { return _collection_count; }
  uint8_t displayCycleIndex() const { return _display_index; }
  const LoopCounters& counters() const { return _counters; }

  bool hasPreviousSnapshot() const { return _has_previous; }
  const SensorSnapshot& previousSnapshot() const { return _previous; }

private:
  bool leaveStopState_();
  bool step_();
  bool handleBinFull_();
  bool handleObstacle_(double distance_cm);
  bool collect_(const Verdict& verdict, const SensorSnapshot& snap);
  void idle_(const SensorSnapshot& snap);
  bool enterFault_(const std::string& message);

  void transition_(RobotState next);
  bool hold_(uint32_t duration_ms);
  void logStatus_(const SensorSnapshot& snap) const;

  Camera& _camera;
  ImageClassifier& _classifier;
  SensorHub& _sensors;
  ActuatorDriver& _actuators;
  DisplaySink& _display;
  CollectionLog& _log;
  Clock& _clock;
  const CancelToken& _cancel;
  ControlParams _params;

  Rate _cadence;

  RobotState _state = RobotState::SCANNING;
  uint64_t _collection_count = 0;
  uint8_t _display_index = 0;

  SensorSnapshot _previous;
  bool _has_previous = false;

  uint32_t _start_ms = 0;
  bool _shut_down = false;

  LoopCounters _counters;
};
