/*
  AMLAC Controller (Raspberry Pi layer)

  Purpose:
  Wires the hardware backends to the ControlLoop and runs it until SIGINT /
  SIGTERM.

  Usage:
    amlac_controller [config.json]

  Exit status:
    0  operator shutdown
    1  startup failure, or cancelled while in FAULT
*/

#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include "Devices.h"
#include "Params.h"

#include "actuators/ActuatorDriver.h"
#include "comms/SerialLink.h"
#include "comms/SerialPort.h"
#include "config/ConfigLoader.h"
#include "config/RobotConfig.h"
#include "control/ControlLoop.h"
#include "present/CollectionLog.h"
#include "present/DisplaySink.h"
#include "present/TextPanel.h"
#include "sensors/BoardInputs.h"
#include "sensors/ColorSensor.h"
#include "sensors/DistanceSensor.h"
#include "sensors/GpsReceiver.h"
#include "sensors/I2cBus.h"
#include "sensors/ImuSensor.h"
#include "sensors/SensorHub.h"
#include "utils/Clock.h"
#include "utils/Hold.h"
#include "utils/Log.h"
#include "vision/Camera.h"
#include "vision/Classifier.h"
#include "vision/TfLiteModel.h"

static const char* TAG = "main";


/*=============================================================================
  GLOBALS
=============================================================================*/

// Set from the signal handler, polled by the ControlLoop at hold slices
static CancelToken g_cancel;

static void onSignal(int) {
  g_cancel.request();
}

static bool installSignalHandlers() {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = onSignal;
  sigemptyset(&sa.sa_mask);

  return sigaction(SIGINT, &sa, nullptr) == 0 &&
         sigaction(SIGTERM, &sa, nullptr) == 0;
}


/*=============================================================================
  SETUP
=============================================================================*/

static bool loadConfig(int argc, char** argv, RobotConfig& cfg) {
  if (argc > 2) {
    fprintf(stderr, "usage: %s [config.json]\n", argv[0]);
    return false;
  }

  if (argc == 2) {
    std::string err;
    if (!config::loadFile(argv[1], cfg, err)) {
      AMLAC_LOGE(TAG, "config: %s", err.c_str());
      return false;
    }
  }

  logging::setLevel(cfg.log_level);
  return true;
}


/*=============================================================================
  MAIN
=============================================================================*/

int main(int argc, char** argv) {
  logging::setLevel(LogLevel::INFO);

  RobotConfig cfg;
  if (!loadConfig(argc, argv, cfg)) return 1;

  if (!installSignalHandlers()) {
    AMLAC_LOGE(TAG, "cannot install signal handlers");
    return 1;
  }

  SteadyClock clock;

  // Display
  ConsolePanel panel;
  DisplaySink sink(panel, clock, cfg.display);
  sink.post(display::startup());

  // Motor board link (drive, conveyor, ultrasonic, load cell, float switch)
  SerialPort board_port(cfg.devices.board_port, cfg.devices.board_baud);
  if (!board_port.open()) {
    AMLAC_LOGE(TAG, "motor board link unavailable, refusing to start");
    sink.post(display::error("No motor board"));
    return 1;
  }
  SerialLink link(board_port);
  link.begin();

  ActuatorDriver actuators(link, clock);
  actuators.stopAll();

  // I2C sensors
  LinuxI2cBus i2c(cfg.devices.i2c_bus, cfg.sensors.i2c_timeout_ms);
  if (!i2c.init()) {
    AMLAC_LOGW(TAG, "I2C bus unavailable, color and orientation will be absent");
  }
  ColorSensor color(i2c, cfg.devices.color_address);
  ImuSensor imu(i2c, cfg.devices.imu_address);
  if (i2c.isOpen()) {
    color.init();
    imu.init();
  }

  // GPS
  SerialPort gps_port(cfg.devices.gps_port, cfg.devices.gps_baud);
  if (!gps_port.open()) {
    AMLAC_LOGW(TAG, "GPS port unavailable, position will be absent");
  }
  GpsReceiver gps(gps_port,
                  cfg.sensors.gps_min_fix_quality,
                  cfg.sensors.gps_min_satellites,
                  cfg.sensors.gps_max_fix_age_ms);

  // Board-side sensors
  DistanceSensor range(link,
                       cfg.sensors.ultrasonic_min_cm,
                       cfg.sensors.ultrasonic_max_cm,
                       cfg.sensors.ultrasonic_max_age_ms);
  BoardLoadCell load_cell(link);
  BoardBinSwitch bin_switch(link, cfg.sensors.board_max_age_ms);

  SensorSourceSet sources;
  sources.color = &color;
  sources.orientation = &imu;
  sources.position = &gps;
  sources.range = &range;
  sources.load_cell = &load_cell;
  sources.bin_switch = &bin_switch;

  SensorHub hub(sources, clock, cfg.sensors);
  if (cfg.sensors.tare_at_startup) {
    hub.tareLoadCell(cfg.sensors.tare_timeout_ms);
  }

  // Vision
  PpmFileCamera camera(cfg.devices.camera_frame);

  auto model = std::make_shared<TfLiteModel>(cfg.classifier.threads);
  if (model->load(cfg.classifier.model_path)) {
    cfg.classifier.input_size = model->inputSize();
  } else {
    AMLAC_LOGW(TAG, "model %s not loaded, detection disabled", cfg.classifier.model_path.c_str());
  }

  Classifier classifier(model, cfg.classifier);
  classifier.start();

  // Persistence
  CollectionLog log(cfg.collection_log);
  if (!log.open()) {
    AMLAC_LOGW(TAG, "collection log %s not writable, collections will not be persisted",
               cfg.collection_log.c_str());
  }

  ControlLoop loop(camera, classifier, hub, actuators, sink, log, clock, g_cancel, cfg.control);
  const int rc = loop.run();

  if (!classifier.stop()) {
    AMLAC_LOGW(TAG, "classifier worker abandoned mid-inference");
  }
  board_port.close();
  gps_port.close();

  AMLAC_LOGI(TAG, "exit %d", rc);
  return rc;
}
