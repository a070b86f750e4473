#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "actuators/MotorBoard.h"
#include "comms/Stream.h"
#include "present/TextPanel.h"
#include "sensors/I2cBus.h"
#include "sensors/SensorSources.h"
#include "utils/Clock.h"
#include "utils/Hold.h"
#include "vision/Camera.h"
#include "vision/Classifier.h"

/*
  Test doubles for every hardware seam.
*/

// sleepMs() advances time instantly. Optionally requests cancellation once
// time reaches cancel_at_ms.
class ManualClock : public Clock {
public:
  uint32_t now = 0;
  std::time_t wall_base = 1700000000;

  CancelToken* cancel = nullptr;
  uint32_t cancel_at_ms = 0;

  uint64_t slept_ms = 0;
  uint32_t sleeps = 0;

  uint32_t nowMs() const override { return now; }
  std::time_t wallTime() const override { return wall_base + now / 1000; }

  void sleepMs(uint32_t ms) override {
    now += ms;
    slept_ms += ms;
    sleeps++;
    if (cancel != nullptr && now >= cancel_at_ms) cancel->request();
  }
};

class FakeStream : public Stream {
public:
  bool open = true;
  bool write_ok = true;
  std::deque<uint8_t> rx;
  std::string tx;

  void feed(const std::string& s) {
    for (size_t i = 0; i < s.size(); i++) rx.push_back((uint8_t)s[i]);
  }

  bool isOpen() const override { return open; }
  int available() override { return (int)rx.size(); }

  int read() override {
    if (rx.empty()) return -1;
    const int c = rx.front();
    rx.pop_front();
    return c;
  }

  bool write(const uint8_t* data, size_t len) override {
    if (!open || !write_ok) return false;
    tx.append(reinterpret_cast<const char*>(data), len);
    return true;
  }
};

// Register map per device; fail_reads makes the next N reads fail.
class FakeI2cBus : public I2cBus {
public:
  std::map<std::pair<uint8_t, uint8_t>, std::vector<uint8_t>> regs;
  std::vector<std::pair<uint8_t, std::vector<uint8_t>>> writes;   // (reg, payload)
  int fail_reads = 0;
  int fail_writes = 0;
  int reads = 0;

  void set(uint8_t addr, uint8_t reg, const std::vector<uint8_t>& bytes) {
    regs[std::make_pair(addr, reg)] = bytes;
  }

  bool write(uint8_t, uint8_t reg, const uint8_t* data, size_t len) override {
    if (fail_writes > 0) {
      fail_writes--;
      return false;
    }
    writes.push_back(std::make_pair(reg, std::vector<uint8_t>(data, data + len)));
    return true;
  }

  bool read(uint8_t addr, uint8_t reg, uint8_t* data, size_t len) override {
    reads++;
    if (fail_reads > 0) {
      fail_reads--;
      return false;
    }
    auto it = regs.find(std::make_pair(addr, reg));
    if (it == regs.end() || it->second.size() < len) return false;
    memcpy(data, it->second.data(), len);
    return true;
  }
};

/*-----------------------------------------------------------------------------
  Sensor sources
-----------------------------------------------------------------------------*/

class FakeColor : public ColorSource {
public:
  bool ok = true;
  int fail_next = 0;
  int calls = 0;
  Rgb8 value;

  bool readRgb(Rgb8& out) override {
    calls++;
    if (fail_next > 0) {
      fail_next--;
      return false;
    }
    if (!ok) return false;
    out = value;
    return true;
  }
};

class FakeOrientation : public OrientationSource {
public:
  bool ok = true;
  int fail_next = 0;
  int calls = 0;
  Orientation value;

  bool readOrientation(Orientation& out) override {
    calls++;
    if (fail_next > 0) {
      fail_next--;
      return false;
    }
    if (!ok) return false;
    out = value;
    return true;
  }
};

class FakePosition : public PositionSource {
public:
  bool ok = false;
  int calls = 0;
  GeoPoint value;

  bool readFix(GeoPoint& out, uint32_t) override {
    calls++;
    if (!ok) return false;
    out = value;
    return true;
  }
};

class FakeRange : public RangeSource {
public:
  bool ok = true;
  int calls = 0;
  double value = 120.0;

  bool readDistanceCm(double& out, uint32_t) override {
    calls++;
    if (!ok) return false;
    out = value;
    return true;
  }
};

// Returns `value` forever unless ok is false; samples overrides it in order.
class FakeLoadCell : public LoadCellSource {
public:
  bool ok = true;
  int32_t value = 0;
  std::deque<int32_t> samples;
  int calls = 0;

  bool readRaw(int32_t& out, uint32_t) override {
    calls++;
    if (!samples.empty()) {
      out = samples.front();
      samples.pop_front();
      return true;
    }
    if (!ok) return false;
    out = value;
    return true;
  }
};

class FakeSwitch : public SwitchSource {
public:
  bool ok = true;
  bool active = false;
  int calls = 0;

  bool readActive(bool& out, uint32_t) override {
    calls++;
    if (!ok) return false;
    out = active;
    return true;
  }
};

/*-----------------------------------------------------------------------------
  Actuation / vision / display
-----------------------------------------------------------------------------*/

struct SentCommand {
  DriveCommand drive;
  MechanismCommand mech;

  bool allStopped() const {
    return drive.left_pct == 0 && drive.right_pct == 0 &&
           mech.collector == CollectorMode::STOP;
  }
};

class RecordingBoard : public MotorBoard {
public:
  bool connected = true;
  ActuatorStatus status = ActuatorStatus::OK;

  // When > 0, the Nth sendCommand from now (1-based) and the fail_times - 1
  // calls after it return fail_status
  int fail_on_call = 0;
  int fail_times = 1;
  ActuatorStatus fail_status = ActuatorStatus::LINK_ERROR;
  int failing = 0;

  std::vector<SentCommand> sent;   // every attempt, including failed ones

  bool isConnected() const override { return connected; }

  ActuatorStatus sendCommand(const DriveCommand& drive,
                             const MechanismCommand& mech,
                             uint32_t) override {
    SentCommand c;
    c.drive = drive;
    c.mech = mech;
    sent.push_back(c);

    if (fail_on_call > 0 && --fail_on_call == 0) failing = fail_times;
    if (failing > 0) {
      failing--;
      return fail_status;
    }
    return status;
  }

  int count(CollectorMode collector) const {
    int n = 0;
    for (size_t i = 0; i < sent.size(); i++) {
      if (sent[i].mech.collector == collector) n++;
    }
    return n;
  }
};

class FakeCamera : public Camera {
public:
  bool has_frame = true;
  bool throw_next = false;
  bool throw_foreign = false;   // throws a non-std::exception
  int captures = 0;

  bool capture(Image& out) override {
    captures++;
    if (throw_foreign) throw 42;
    if (throw_next) {
      throw_next = false;
      throw std::runtime_error("camera pipeline died");
    }
    if (!has_frame) return false;
    out.width = 4;
    out.height = 4;
    out.channels = 3;
    out.data.assign(4 * 4 * 3, 128);
    return true;
  }
};

// Returns queued results first, then `fallback`.
class ScriptedClassifier : public ImageClassifier {
public:
  std::deque<ClassifyResult> script;
  ClassifyResult fallback;
  int calls = 0;

  ScriptedClassifier() { fallback.status = ClassifierStatus::OK; }

  static ClassifyResult verdict(bool detected, double confidence) {
    ClassifyResult r;
    r.status = ClassifierStatus::OK;
    r.verdict.detected = detected;
    r.verdict.confidence = confidence;
    return r;
  }

  static ClassifyResult failure(ClassifierStatus status) {
    ClassifyResult r;
    r.status = status;
    return r;
  }

  ClassifyResult classify(const Image&) override {
    calls++;
    if (script.empty()) return fallback;
    ClassifyResult r = script.front();
    script.pop_front();
    return r;
  }
};

class RecordingPanel : public TextPanel {
public:
  std::vector<std::pair<std::string, std::string>> shown;
  bool ok = true;

  bool show(const char* line1, const char* line2) override {
    shown.push_back(std::make_pair(std::string(line1), std::string(line2)));
    return ok;
  }
};

// Per-test scratch directory, removed with its files.
class TempDir {
public:
  TempDir() {
    char tmpl[] = "/tmp/amlac_test_XXXXXX";
    const char* p = mkdtemp(tmpl);
    if (p == nullptr) throw std::runtime_error("mkdtemp failed");
    _path = p;
  }

  ~TempDir() {
    const std::string cmd = "rm -rf '" + _path + "'";
    const int rc = system(cmd.c_str());
    (void)rc;
  }

  const std::string& path() const { return _path; }
  std::string file(const std::string& name) const { return _path + "/" + name; }

private:
  std::string _path;
};
