#include "control/ControlLoop.h"

#include <exception>

#include "utils/Log.h"

static const char* TAG = "ControlLoop";

static constexpr uint8_t DISPLAY_PAGES = 3;

const char* robotStateName(RobotState s) {
  switch (s) {
    case RobotState::SCANNING: return "SCANNING";
    case RobotState::COLLECTING: return "COLLECTING";
    case RobotState::BIN_FULL: return "BIN_FULL";
    case RobotState::FAULT: return "FAULT";
    default: return "?";
  }
}

ControlLoop::ControlLoop(Camera& camera,
                         ImageClassifier& classifier,
                         SensorHub& sensors,
                         ActuatorDriver& actuators,
                         DisplaySink& display,
                         CollectionLog& log,
                         Clock& clock,
                         const CancelToken& cancel,
                         const ControlParams& params)
: _camera(camera),
  _classifier(classifier),
  _sensors(sensors),
  _actuators(actuators),
  _display(display),
  _log(log),
  _clock(clock),
  _cancel(cancel),
  _params(params),
  _cadence(params.loop_period_ms)
{
  _start_ms = _clock.nowMs();
}

void ControlLoop::transition_(RobotState next) {
  if (next == _state) return;
  AMLAC_LOGI(TAG, "%s -> %s", robotStateName(_state), robotStateName(next));
  _state = next;
}

bool ControlLoop::hold_(uint32_t duration_ms) {
  return holdFor(_clock, _cancel, duration_ms, _params.hold_slice_ms);
}

/*=============================================================================
  CYCLE
=============================================================================*/

bool ControlLoop::runCycle() {
  if (_cancel.requested()) return false;

  _cadence.start(_clock.nowMs());
  _counters.cycles++;

  bool completed = true;
  try {
    if (leaveStopState_()) {
      completed = step_();
    } else {
      completed = enterFault_("stop unconfirmed");
    }
  } catch (const std::exception& e) {
    completed = enterFault_(e.what());
  }

  _display.tick();

  if (!completed) return false;

  return hold_(_cadence.remainingMs(_clock.nowMs()));
}

/*
  FAULT and BIN_FULL never survive into the next decision, but the robot
  only scans again once the board has accepted an all-stop. After a fault
  the stop is always re-sent: the failed frame may have left the collector
  running.
*/
bool ControlLoop::leaveStopState_() {
  if (_state != RobotState::FAULT && _state != RobotState::BIN_FULL) return true;

  if (_state == RobotState::FAULT || !_actuators.stateConfirmed()) {
    _actuators.stopAll();
  }
  if (!_actuators.stateConfirmed()) {
    AMLAC_LOGW(TAG, "board has not confirmed all-stop, staying in %s", robotStateName(_state));
    return false;
  }

  transition_(RobotState::SCANNING);
  return true;
}

bool ControlLoop::step_() {
  // 1. Capture + classify
  ClassifyResult result;
  Image frame;
  if (_camera.capture(frame)) {
    result = _classifier.classify(frame);
  } else {
    result.status = ClassifierStatus::NO_FRAME;
  }

  if (!result.ok()) {
    _counters.classifier_failures++;
    AMLAC_LOGD(TAG, "classifier: %s, treating as no detection",
               classifierStatusName(result.status));
  }

  // 2. Sense
  const SensorSnapshot snap = _sensors.poll();

  // 3. Decide + actuate
  bool completed = true;

  if (snap.bin_full) {
    completed = handleBinFull_();
  } else if (_params.obstacle_enabled &&
             snap.distance_cm.fresh() &&
             snap.distance_cm.value() < _params.obstacle_min_cm) {
    completed = handleObstacle_(snap.distance_cm.value());
  } else if (result.ok() &&
             result.verdict.detected &&
             result.verdict.confidence > _params.confidence_threshold) {
    completed = collect_(result.verdict, snap);
  } else {
    idle_(snap);
  }

  // 4. Status summary
  if (completed && _params.status_every_cycles > 0 &&
      _counters.cycles % _params.status_every_cycles == 0) {
    logStatus_(snap);
  }

  _previous = snap;
  _has_previous = true;
  return completed;
}

/*=============================================================================
  HANDLERS
=============================================================================*/

bool ControlLoop::enterFault_(const std::string& message) {
  transition_(RobotState::FAULT);
  _counters.faults++;

  _actuators.stopAll();
  _display.post(display::error(message.c_str()));
  AMLAC_LOGE(TAG, "fault: %s (backoff %u ms)", message.c_str(), (unsigned)_params.fault_backoff_ms);

  return hold_(_params.fault_backoff_ms);
}

bool ControlLoop::handleBinFull_() {
  transition_(RobotState::BIN_FULL);
  _counters.bin_full_events++;

  _actuators.stopAll();
  if (!_actuators.stateConfirmed()) return enterFault_("stop unconfirmed");

  _display.post(display::binFull());
  AMLAC_LOGW(TAG, "collection bin full, holding %u ms", (unsigned)_params.bin_full_cooldown_ms);

  if (!hold_(_params.bin_full_cooldown_ms)) return false;

  transition_(RobotState::SCANNING);
  return true;
}

bool ControlLoop::handleObstacle_(double distance_cm) {
  _counters.obstacle_events++;
  AMLAC_LOGW(TAG, "obstacle at %.1f cm, turning right", distance_cm);

  ActuatorStatus st = _actuators.stopPropulsion();
  if (st != ActuatorStatus::OK) return enterFault_(std::string("stop: ") + actuatorStatusName(st));

  _display.post(display::obstacle(distance_cm));

  const int speed = _params.obstacle_turn_speed;
  st = _actuators.setPropulsion(speed, -speed);
  if (st != ActuatorStatus::OK) return enterFault_(std::string("turn: ") + actuatorStatusName(st));

  // Cancelled mid-turn: shutdown() stops the motors
  if (!hold_(_params.obstacle_turn_ms)) return false;

  st = _actuators.stopPropulsion();
  if (st != ActuatorStatus::OK) return enterFault_(std::string("stop: ") + actuatorStatusName(st));

  return true;
}

bool ControlLoop::collect_(const Verdict& verdict, const SensorSnapshot& snap) {
  transition_(RobotState::COLLECTING);
  AMLAC_LOGI(TAG, "algae detected (confidence %.2f), collecting", verdict.confidence);

  _display.post(display::detection(verdict.confidence, _collection_count));

  ActuatorStatus st = _actuators.startCollectionMechanism();
  if (st != ActuatorStatus::OK) return enterFault_(std::string("collector: ") + actuatorStatusName(st));

  // Cancelled mid-collection: not counted, shutdown() stops the collector
  if (!hold_(_params.collection_ms)) return false;

  st = _actuators.stopCollectionMechanism();
  if (st != ActuatorStatus::OK) return enterFault_(std::string("collector: ") + actuatorStatusName(st));

  _collection_count++;

  CollectionEvent e;
  e.timestamp = snap.wall_time;
  e.detected = verdict.detected;
  e.confidence = verdict.confidence;
  e.has_gps = snap.gps.present();
  if (e.has_gps) e.gps = snap.gps.value();
  e.weight_kg = snap.weight_kg.present() ? snap.weight_kg.value() : 0.0;
  e.collection_count = _collection_count;
  e.has_distance = snap.distance_cm.present();
  if (e.has_distance) e.distance_cm = snap.distance_cm.value();
  e.has_orientation = snap.orientation.present();
  if (e.has_orientation) e.orientation = snap.orientation.value();

  if (!_log.append(e)) {
    _counters.log_failures++;
    AMLAC_LOGE(TAG, "collection #%llu not persisted", (unsigned long long)_collection_count);
  }

  AMLAC_LOGI(TAG, "collection complete, total %llu", (unsigned long long)_collection_count);

  _display_index = 0;
  transition_(RobotState::SCANNING);
  return true;
}

void ControlLoop::idle_(const SensorSnapshot& snap) {
  switch (_display_index) {
    case 0:
      _display.post(display::scanning(_collection_count));
      break;

    case 1: {
      if (snap.gps.present()) {
        _display.post(display::position(true, snap.gps.value()));
      } else if (_has_previous && _previous.gps.present()) {
        _display.post(display::position(true, _previous.gps.value()));
      } else {
        _display.post(display::position(false, GeoPoint()));
      }
      break;
    }

    default:
      _display.post(display::weight(snap.weight_kg.present() ? snap.weight_kg.value() : 0.0));
      break;
  }

  _display_index = (uint8_t)((_display_index + 1) % DISPLAY_PAGES);
}

/*=============================================================================
  STATUS / SHUTDOWN
=============================================================================*/

void ControlLoop::logStatus_(const SensorSnapshot& snap) const {
  const uint32_t runtime_s = (_clock.nowMs() - _start_ms) / 1000;

  AMLAC_LOGI(TAG, "status: runtime %02u:%02u:%02u, state %s, collections %llu",
             (unsigned)(runtime_s / 3600), (unsigned)((runtime_s / 60) % 60), (unsigned)(runtime_s % 60),
             robotStateName(_state), (unsigned long long)_collection_count);

  if (snap.weight_kg.present()) {
    AMLAC_LOGI(TAG, "status: weight %.2f kg (%s)", snap.weight_kg.value(),
               freshnessName(snap.weight_kg.freshness()));
  } else {
    AMLAC_LOGI(TAG, "status: weight unavailable");
  }

  if (snap.gps.present()) {
    AMLAC_LOGI(TAG, "status: gps %.6f, %.6f", snap.gps.value().lat, snap.gps.value().lon);
  } else {
    AMLAC_LOGI(TAG, "status: gps no fix");
  }

  if (snap.distance_cm.present()) {
    AMLAC_LOGI(TAG, "status: distance %.1f cm", snap.distance_cm.value());
  } else {
    AMLAC_LOGI(TAG, "status: distance unavailable");
  }

  if (snap.orientation.present()) {
    AMLAC_LOGI(TAG, "status: pitch %.1f roll %.1f",
               snap.orientation.value().pitch_deg, snap.orientation.value().roll_deg);
  } else {
    AMLAC_LOGI(TAG, "status: orientation unavailable");
  }
}

void ControlLoop::shutdown() {
  if (_shut_down) return;
  _shut_down = true;

  _actuators.stopAll();
  _display.post(display::shutdown());

  const uint32_t runtime_s = (_clock.nowMs() - _start_ms) / 1000;
  AMLAC_LOGI(TAG, "shutdown in %s after %llu cycles, %u s",
             robotStateName(_state), (unsigned long long)_counters.cycles, (unsigned)runtime_s);
  AMLAC_LOGI(TAG, "collections %llu, faults %llu, classifier failures %llu, bin full %llu",
             (unsigned long long)_collection_count,
             (unsigned long long)_counters.faults,
             (unsigned long long)_counters.classifier_failures,
             (unsigned long long)_counters.bin_full_events);

  LogStatistics stats;
  if (_log.statistics(stats)) {
    AMLAC_LOGI(TAG, "log: %u rows, %u detections, avg confidence %.1f%%, detection rate %.1f%%",
               (unsigned)stats.rows, (unsigned)stats.detections,
               stats.average_confidence * 100.0, stats.detection_rate * 100.0);
  } else {
    AMLAC_LOGW(TAG, "log statistics unavailable (%s)", _log.path().c_str());
  }
}

int ControlLoop::run() {
  AMLAC_LOGI(TAG, "running: period %u ms, threshold %.2f",
             (unsigned)_params.loop_period_ms, _params.confidence_threshold);
  _display.post(display::ready());

  try {
    while (runCycle()) {
    }
  } catch (...) {
    // Not a std::exception: stop the hardware before it propagates
    shutdown();
    throw;
  }

  const bool faulted = (_state == RobotState::FAULT);
  shutdown();
  return faulted ? 1 : 0;
}
