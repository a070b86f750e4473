#include <gtest/gtest.h>

#include "Fakes.h"
#include "comms/SerialLink.h"
#include "sensors/BoardInputs.h"
#include "sensors/DistanceSensor.h"
#include "sensors/SensorHub.h"

class SensorHubTest : public ::testing::Test {
protected:
  ManualClock clock;
  FakeColor color;
  FakeOrientation orientation;
  FakePosition position;
  FakeRange range;
  FakeLoadCell load_cell;
  FakeSwitch bin_switch;
  SensorParams params;

  SensorSourceSet sources() {
    SensorSourceSet s;
    s.color = &color;
    s.orientation = &orientation;
    s.position = &position;
    s.range = &range;
    s.load_cell = &load_cell;
    s.bin_switch = &bin_switch;
    return s;
  }

  void SetUp() override {
    params.load_cell_counts_per_gram = 2.0;
    params.load_cell_tare_offset = 0.0;
    params.load_cell_samples = 5;
    params.i2c_retry_backoff_ms = 5;
  }
};

TEST_F(SensorHubTest, AllSourcesHealthyGivesValidFields) {
  color.value.r = 10;
  orientation.value.pitch_deg = 2.5;
  position.ok = true;
  position.value.lat = 14.5995;
  range.value = 88.0;
  load_cell.value = 4000;   // 2000 g

  SensorHub hub(sources(), clock, params);
  const SensorSnapshot s = hub.poll();

  ASSERT_TRUE(s.color.fresh());
  EXPECT_EQ(10, s.color.value().r);
  ASSERT_TRUE(s.orientation.fresh());
  EXPECT_DOUBLE_EQ(2.5, s.orientation.value().pitch_deg);
  ASSERT_TRUE(s.gps.fresh());
  EXPECT_DOUBLE_EQ(14.5995, s.gps.value().lat);
  ASSERT_TRUE(s.distance_cm.fresh());
  EXPECT_DOUBLE_EQ(88.0, s.distance_cm.value());
  ASSERT_TRUE(s.weight_kg.fresh());
  EXPECT_DOUBLE_EQ(2.0, s.weight_kg.value());
  EXPECT_FALSE(s.bin_full);
  EXPECT_EQ(clock.wall_base, s.wall_time);
}

TEST_F(SensorHubTest, FailedSourcesAreAbsentNotZeroAndOthersStillRead) {
  color.ok = false;
  orientation.ok = false;
  range.ok = false;
  position.ok = false;
  load_cell.value = 200;

  SensorHub hub(sources(), clock, params);
  const SensorSnapshot s = hub.poll();

  EXPECT_EQ(Freshness::UNAVAILABLE, s.color.freshness());
  EXPECT_EQ(Freshness::UNAVAILABLE, s.orientation.freshness());
  EXPECT_EQ(Freshness::UNAVAILABLE, s.distance_cm.freshness());
  EXPECT_EQ(Freshness::UNAVAILABLE, s.gps.freshness());
  EXPECT_TRUE(s.weight_kg.fresh());

  EXPECT_EQ(1, position.calls);
  EXPECT_EQ(1, range.calls);
  EXPECT_EQ(1, bin_switch.calls);
}

TEST_F(SensorHubTest, I2cReadsRetryExactlyOnceAfterBackoff) {
  color.fail_next = 1;        // recovers on retry
  orientation.ok = false;     // fails both attempts

  SensorHub hub(sources(), clock, params);
  const SensorSnapshot s = hub.poll();

  EXPECT_TRUE(s.color.fresh());
  EXPECT_EQ(2, color.calls);
  EXPECT_FALSE(s.orientation.present());
  EXPECT_EQ(2, orientation.calls);

  EXPECT_EQ(2u, hub.i2cRetries());
  EXPECT_EQ(10u, clock.slept_ms);
}

TEST_F(SensorHubTest, WeightAveragesTaresAndScales) {
  params.load_cell_tare_offset = 100.0;
  load_cell.samples = {2100, 2100, 2100, 2100, 2100};   // 2000 counts over tare

  SensorHub hub(sources(), clock, params);
  const SensorSnapshot s = hub.poll();

  ASSERT_TRUE(s.weight_kg.fresh());
  EXPECT_DOUBLE_EQ(1.0, s.weight_kg.value());   // 2000 / 2 = 1000 g
  EXPECT_EQ(5, load_cell.calls);
}

TEST_F(SensorHubTest, WeightFailureReusesPreviousAsStale) {
  SensorHub hub(sources(), clock, params);

  load_cell.value = 3000;
  const SensorSnapshot first = hub.poll();
  ASSERT_TRUE(first.weight_kg.fresh());

  load_cell.ok = false;
  const SensorSnapshot second = hub.poll();
  ASSERT_EQ(Freshness::STALE, second.weight_kg.freshness());
  EXPECT_DOUBLE_EQ(first.weight_kg.value(), second.weight_kg.value());
  EXPECT_FALSE(second.weight_kg.fresh());
}

TEST_F(SensorHubTest, PartialSamplesCarryIntoNextPoll) {
  load_cell.ok = false;
  SensorHub hub(sources(), clock, params);

  // The board streams 3 samples per cycle; 5 are averaged
  load_cell.samples = {2000, 2000, 2000};
  EXPECT_EQ(Freshness::UNAVAILABLE, hub.poll().weight_kg.freshness());

  load_cell.samples = {2000, 2000, 2000};
  const SensorSnapshot s = hub.poll();
  ASSERT_TRUE(s.weight_kg.fresh());
  EXPECT_DOUBLE_EQ(1.0, s.weight_kg.value());
  EXPECT_EQ(1u, load_cell.samples.size());
}

TEST_F(SensorHubTest, WeightNeverReadIsUnavailable) {
  load_cell.ok = false;
  SensorHub hub(sources(), clock, params);
  EXPECT_EQ(Freshness::UNAVAILABLE, hub.poll().weight_kg.freshness());
}

TEST_F(SensorHubTest, BinSwitchUnavailableMeansNotFull) {
  bin_switch.ok = false;
  SensorHub hub(sources(), clock, params);
  EXPECT_FALSE(hub.poll().bin_full);

  bin_switch.ok = true;
  bin_switch.active = true;
  EXPECT_TRUE(hub.poll().bin_full);
}

TEST_F(SensorHubTest, MissingSourcesAreAlwaysUnavailable) {
  SensorHub hub(SensorSourceSet(), clock, params);
  const SensorSnapshot s = hub.poll();
  EXPECT_FALSE(s.color.present());
  EXPECT_FALSE(s.orientation.present());
  EXPECT_FALSE(s.gps.present());
  EXPECT_FALSE(s.distance_cm.present());
  EXPECT_FALSE(s.weight_kg.present());
  EXPECT_FALSE(s.bin_full);
}

TEST_F(SensorHubTest, TareAveragesSamples) {
  load_cell.samples = {90, 110, 100, 95, 105};
  SensorHub hub(sources(), clock, params);

  ASSERT_TRUE(hub.tareLoadCell(1000));
  EXPECT_DOUBLE_EQ(100.0, hub.tareOffset());
  EXPECT_DOUBLE_EQ(0.0, hub.countsToKg(100.0));
}

TEST_F(SensorHubTest, TareTimesOutAndKeepsConfiguredOffset) {
  params.load_cell_tare_offset = 42.0;
  load_cell.ok = false;
  load_cell.samples = {1, 2};
  SensorHub hub(sources(), clock, params);

  EXPECT_FALSE(hub.tareLoadCell(500));
  EXPECT_DOUBLE_EQ(42.0, hub.tareOffset());
  EXPECT_GE(clock.now, 500u);
}

/*-----------------------------------------------------------------------------
  Board-backed sources
-----------------------------------------------------------------------------*/

static std::string telemetry(bool us_valid, const char* cm, const char* bin_full, const char* raw) {
  return std::string("{\"type\":\"telemetry\",\"board_time_ms\":1,\"ack_seq\":0,"
                     "\"ultrasonic\":{\"valid\":") + (us_valid ? "true" : "false") +
         ",\"distance_cm\":" + cm + "},\"load_cell\":{\"raw\":" + raw +
         "},\"bin_full\":" + bin_full + "}\n";
}

TEST(BoardSources, DistanceRequiresValidInRangeAndFresh) {
  FakeStream stream;
  SerialLink link(stream);
  link.begin();
  DistanceSensor range(link, 2.0, 400.0, 250);

  double cm = 0.0;
  EXPECT_FALSE(range.readDistanceCm(cm, 0));   // no telemetry yet

  stream.feed(telemetry(true, "35.5", "false", "0"));
  ASSERT_TRUE(range.readDistanceCm(cm, 100));
  EXPECT_DOUBLE_EQ(35.5, cm);
  EXPECT_TRUE(range.getState().valid);

  EXPECT_FALSE(range.readDistanceCm(cm, 400));   // 300 ms old

  stream.feed(telemetry(true, "1.0", "false", "0"));
  EXPECT_FALSE(range.readDistanceCm(cm, 500));   // below minimum

  stream.feed(telemetry(false, "50.0", "false", "0"));
  EXPECT_FALSE(range.readDistanceCm(cm, 600));   // board flagged invalid
}

TEST(BoardSources, BinSwitchAndLoadCellFromTelemetry) {
  FakeStream stream;
  SerialLink link(stream);
  link.begin();
  BoardBinSwitch bin(link, 1000);
  BoardLoadCell cell(link);

  bool active = false;
  EXPECT_FALSE(bin.readActive(active, 0));

  stream.feed(telemetry(false, "null", "true", "777"));
  ASSERT_TRUE(bin.readActive(active, 10));
  EXPECT_TRUE(active);

  int32_t raw = 0;
  ASSERT_TRUE(cell.readRaw(raw, 10));
  EXPECT_EQ(777, raw);
  EXPECT_FALSE(cell.readRaw(raw, 10));

  stream.feed(telemetry(false, "null", "null", "null"));
  EXPECT_FALSE(bin.readActive(active, 20));   // switch not reported

  EXPECT_FALSE(bin.readActive(active, 5000));  // telemetry too old
}
