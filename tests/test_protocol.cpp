#include <gtest/gtest.h>

#include <string>

#include "comms/Protocol.h"

TEST(Protocol, EncodesCommandAsOneJsonLine) {
  CommandFrame cmd;
  cmd.seq = 7;
  cmd.host_time_ms = 1234;
  cmd.drive.left_pct = 40;
  cmd.drive.right_pct = -40;
  cmd.mech.collector = CollectorMode::RUN;

  const std::string line = protocol::encodeCommandLine(cmd);

  ASSERT_FALSE(line.empty());
  EXPECT_EQ('\n', line[line.size() - 1]);
  EXPECT_EQ(line.size() - 1, line.find('\n'));
  EXPECT_NE(std::string::npos, line.find("\"type\":\"cmd\""));
  EXPECT_NE(std::string::npos, line.find("\"seq\":7"));
  EXPECT_NE(std::string::npos, line.find("\"left\":40"));
  EXPECT_NE(std::string::npos, line.find("\"right\":-40"));
  EXPECT_NE(std::string::npos, line.find("\"collector\":\"RUN\""));
}

TEST(Protocol, DecodesFullTelemetry) {
  TelemetryFrame t;
  ASSERT_TRUE(protocol::decodeTelemetryLine(
      "{\"type\":\"telemetry\",\"board_time_ms\":500,\"ack_seq\":3,"
      "\"ultrasonic\":{\"valid\":true,\"distance_cm\":42.5},"
      "\"load_cell\":{\"raw\":-1200},\"bin_full\":true,\"note\":\"hello\"}",
      t));

  EXPECT_TRUE(t.valid);
  EXPECT_EQ(500u, t.board_time_ms);
  EXPECT_EQ(3u, t.ack_seq);
  EXPECT_TRUE(t.ultrasonic.valid);
  EXPECT_FLOAT_EQ(42.5f, t.ultrasonic.distance_cm);
  EXPECT_TRUE(t.load_cell.present);
  EXPECT_EQ(-1200, t.load_cell.raw);
  EXPECT_TRUE(t.bin_full_present);
  EXPECT_TRUE(t.bin_full);
  EXPECT_STREQ("hello", t.note);
}

TEST(Protocol, NullOptionalFieldsAreAbsent) {
  TelemetryFrame t;
  ASSERT_TRUE(protocol::decodeTelemetryLine(
      "{\"type\":\"telemetry\",\"board_time_ms\":1,\"ack_seq\":0,"
      "\"ultrasonic\":{\"valid\":false,\"distance_cm\":null},"
      "\"load_cell\":{\"raw\":null},\"bin_full\":null,\"note\":null}",
      t));

  EXPECT_FALSE(t.ultrasonic.valid);
  EXPECT_FALSE(t.load_cell.present);
  EXPECT_FALSE(t.bin_full_present);
  EXPECT_STREQ("", t.note);
}

TEST(Protocol, ValidFlagWithoutDistanceIsInvalid) {
  TelemetryFrame t;
  ASSERT_TRUE(protocol::decodeTelemetryLine(
      "{\"type\":\"telemetry\",\"board_time_ms\":1,\"ack_seq\":0,"
      "\"ultrasonic\":{\"valid\":true,\"distance_cm\":null}}",
      t));
  EXPECT_FALSE(t.ultrasonic.valid);
}

TEST(Protocol, RejectsOtherFrameTypesAndMissingFields) {
  TelemetryFrame t;
  EXPECT_FALSE(protocol::decodeTelemetryLine(
      "{\"type\":\"cmd\",\"seq\":1}", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine(
      "{\"type\":\"telemetry\",\"ack_seq\":0,\"ultrasonic\":{\"valid\":false}}", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine(
      "{\"type\":\"telemetry\",\"board_time_ms\":1,\"ack_seq\":0}", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine("{not json", t));
  EXPECT_FALSE(protocol::decodeTelemetryLine(nullptr, t));
  EXPECT_FALSE(t.valid);
}
