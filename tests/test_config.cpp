#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "Fakes.h"
#include "config/ConfigLoader.h"

TEST(Config, DefaultsComeFromParams) {
  RobotConfig cfg;
  EXPECT_DOUBLE_EQ(CONFIDENCE_THRESHOLD, cfg.control.confidence_threshold);
  EXPECT_EQ(MAIN_LOOP_PERIOD_MS, cfg.control.loop_period_ms);
  EXPECT_EQ(COLLECTION_DURATION_MS, cfg.control.collection_ms);
  EXPECT_FALSE(cfg.control.obstacle_enabled);
  EXPECT_EQ(std::string(I2C_BUS_PATH), cfg.devices.i2c_bus);
  EXPECT_EQ(LogLevel::INFO, cfg.log_level);
}

TEST(Config, OverridesPresentKeysOnly) {
  RobotConfig cfg;
  std::string err;

  ASSERT_TRUE(config::applyJson(
      "{\"control\":{\"confidence_threshold\":0.8,\"collection_ms\":3000,\"obstacle_enabled\":true},"
      "\"sensors\":{\"gps_min_satellites\":6},"
      "\"devices\":{\"board_port\":\"/dev/ttyUSB1\",\"imu_address\":105},"
      "\"collection_log\":\"/tmp/x.csv\",\"log_level\":\"debug\"}",
      cfg, err)) << err;

  EXPECT_DOUBLE_EQ(0.8, cfg.control.confidence_threshold);
  EXPECT_EQ(3000u, cfg.control.collection_ms);
  EXPECT_TRUE(cfg.control.obstacle_enabled);
  EXPECT_EQ(6, cfg.sensors.gps_min_satellites);
  EXPECT_EQ("/dev/ttyUSB1", cfg.devices.board_port);
  EXPECT_EQ(105, cfg.devices.imu_address);
  EXPECT_EQ("/tmp/x.csv", cfg.collection_log);
  EXPECT_EQ(LogLevel::DEBUG, cfg.log_level);

  // untouched
  EXPECT_EQ(BIN_FULL_COOLDOWN_MS, cfg.control.bin_full_cooldown_ms);
  EXPECT_EQ(GPS_MIN_FIX_QUALITY, cfg.sensors.gps_min_fix_quality);
}

TEST(Config, ClassifierModelSettings) {
  RobotConfig cfg;
  EXPECT_EQ(std::string(MODEL_PATH), cfg.classifier.model_path);
  EXPECT_EQ(CLASSIFIER_STOP_TIMEOUT_MS, cfg.classifier.stop_timeout_ms);

  std::string err;
  ASSERT_TRUE(config::applyJson(
      "{\"classifier\":{\"model_path\":\"/opt/models/algae.tflite\",\"threads\":4,"
      "\"stop_timeout_ms\":250}}",
      cfg, err)) << err;

  EXPECT_EQ("/opt/models/algae.tflite", cfg.classifier.model_path);
  EXPECT_EQ(4, cfg.classifier.threads);
  EXPECT_EQ(250u, cfg.classifier.stop_timeout_ms);
  EXPECT_EQ(CLASSIFIER_DEADLINE_MS, cfg.classifier.deadline_ms);
}

TEST(Config, WrongTypesKeepDefaults) {
  RobotConfig cfg;
  std::string err;

  ASSERT_TRUE(config::applyJson(
      "{\"control\":{\"loop_period_ms\":\"fast\",\"obstacle_enabled\":1},"
      "\"devices\":{\"imu_address\":300},\"unknown\":{\"x\":1},\"log_level\":\"loud\"}",
      cfg, err));

  EXPECT_EQ(MAIN_LOOP_PERIOD_MS, cfg.control.loop_period_ms);
  EXPECT_FALSE(cfg.control.obstacle_enabled);
  EXPECT_EQ(MPU6050_I2C_ADDRESS, cfg.devices.imu_address);
  EXPECT_EQ(LogLevel::INFO, cfg.log_level);
}

TEST(Config, RejectsMalformedJson) {
  RobotConfig cfg;
  std::string err;

  EXPECT_FALSE(config::applyJson("{\"control\": {", cfg, err));
  EXPECT_FALSE(err.empty());

  err.clear();
  EXPECT_FALSE(config::applyJson("[1, 2, 3]", cfg, err));
  EXPECT_FALSE(err.empty());
}

TEST(Config, LoadFileReadsAndReportsMissingFile) {
  TempDir dir;
  const std::string path = dir.file("amlac.json");
  {
    std::ofstream out(path.c_str());
    out << "{\"display\":{\"alert_hold_ms\":1500}}";
  }

  RobotConfig cfg;
  std::string err;
  ASSERT_TRUE(config::loadFile(path, cfg, err)) << err;
  EXPECT_EQ(1500u, cfg.display.alert_hold_ms);

  EXPECT_FALSE(config::loadFile(dir.file("missing.json"), cfg, err));
  EXPECT_NE(std::string::npos, err.find("missing.json"));
}

TEST(Logging, ParsesLevelNames) {
  LogLevel l = LogLevel::NONE;
  EXPECT_TRUE(logging::parseLevel("warn", l));
  EXPECT_EQ(LogLevel::WARN, l);
  EXPECT_FALSE(logging::parseLevel("verbose", l));
  EXPECT_FALSE(logging::parseLevel(nullptr, l));
}
