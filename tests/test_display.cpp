#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <string>

#include "Fakes.h"
#include "present/DisplayEvent.h"
#include "present/DisplaySink.h"
#include "present/TextPanel.h"

/*-----------------------------------------------------------------------------
  Page content
-----------------------------------------------------------------------------*/

TEST(DisplayEvent, LinesFitThePanel) {
  const DisplayEvent e = display::error("link to motor board lost");
  EXPECT_STREQ("ERROR!", e.line1);
  EXPECT_EQ(DISPLAY_COLUMNS, strlen(e.line2));
  EXPECT_STREQ("link to motor bo", e.line2);
}

TEST(DisplayEvent, DetectionShowsCountAndPercent) {
  const DisplayEvent e = display::detection(0.857, 3);
  EXPECT_STREQ("ALGAE DETECTED!", e.line1);
  EXPECT_STREQ("Cnt:3 C:85%", e.line2);
}

TEST(DisplayEvent, ObstacleAndWeightFormats) {
  EXPECT_STREQ("Distance: 8cm", display::obstacle(7.6).line2);
  EXPECT_STREQ("0.25 kg", display::weight(0.25).line2);
  EXPECT_STREQ("No Fix", display::position(false, GeoPoint()).line2);
}

TEST(DisplayEvent, Priorities) {
  EXPECT_EQ(DisplayPriority::ALERT, displayPriority(DisplayKind::BIN_FULL));
  EXPECT_EQ(DisplayPriority::ALERT, displayPriority(DisplayKind::SHUTDOWN));
  EXPECT_EQ(DisplayPriority::STATUS, displayPriority(DisplayKind::READY));
  EXPECT_EQ(DisplayPriority::ROUTINE, displayPriority(DisplayKind::WEIGHT));
}

/*-----------------------------------------------------------------------------
  DisplaySink
-----------------------------------------------------------------------------*/

class DisplaySinkTest : public ::testing::Test {
protected:
  ManualClock clock;
  RecordingPanel panel;
  DisplayParams params;

  void SetUp() override {
    params.refresh_ms = 500;
    params.alert_hold_ms = 3000;
  }
};

TEST_F(DisplaySinkTest, RoutinePagesWaitForTick) {
  DisplaySink sink(panel, clock, params);

  sink.post(display::scanning(0));
  EXPECT_TRUE(panel.shown.empty());
  EXPECT_TRUE(sink.hasPending());

  sink.tick();
  ASSERT_EQ(1u, panel.shown.size());
  EXPECT_EQ("Scanning...", panel.shown[0].first);
  EXPECT_FALSE(sink.hasPending());
}

TEST_F(DisplaySinkTest, RoutinePagesFollowRefreshCadence) {
  DisplaySink sink(panel, clock, params);

  sink.post(display::scanning(0));
  sink.tick();
  sink.post(display::weight(1.0));
  clock.now = 200;
  sink.tick();
  EXPECT_EQ(1u, panel.shown.size());

  clock.now = 500;
  sink.tick();
  ASSERT_EQ(2u, panel.shown.size());
  EXPECT_EQ("Total Collected", panel.shown[1].first);
}

TEST_F(DisplaySinkTest, NewestPendingPageWins) {
  DisplaySink sink(panel, clock, params);

  sink.post(display::scanning(0));
  sink.post(display::weight(2.0));
  sink.tick();

  ASSERT_EQ(1u, panel.shown.size());
  EXPECT_EQ("Total Collected", panel.shown[0].first);
}

TEST_F(DisplaySinkTest, AlertShowsImmediatelyAndHoldsRoutinePages) {
  DisplaySink sink(panel, clock, params);

  sink.post(display::binFull());
  ASSERT_EQ(1u, panel.shown.size());
  EXPECT_TRUE(sink.alertHolding());

  sink.post(display::scanning(0));
  clock.now = 2999;
  sink.tick();
  EXPECT_EQ(1u, panel.shown.size());
  EXPECT_EQ(DisplayKind::BIN_FULL, sink.shown().kind);

  clock.now = 3000;
  sink.tick();
  ASSERT_EQ(2u, panel.shown.size());
  EXPECT_EQ("Scanning...", panel.shown[1].first);
}

TEST_F(DisplaySinkTest, AlertReplacesAlert) {
  DisplaySink sink(panel, clock, params);

  sink.post(display::obstacle(5.0));
  sink.post(display::error("stop failed"));
  ASSERT_EQ(2u, panel.shown.size());
  EXPECT_EQ("ERROR!", panel.shown[1].first);
}

TEST_F(DisplaySinkTest, StatusPageWaitsOnlyForAlertHold) {
  DisplaySink sink(panel, clock, params);

  sink.post(display::ready());
  ASSERT_EQ(1u, panel.shown.size());

  sink.post(display::detection(0.9, 0));
  sink.post(display::ready());
  EXPECT_EQ(2u, panel.shown.size());
  EXPECT_TRUE(sink.hasPending());

  clock.now = 3000;
  sink.tick();
  ASSERT_EQ(3u, panel.shown.size());
  EXPECT_EQ("System Ready", panel.shown[2].first);
}

TEST_F(DisplaySinkTest, PanelFailureIsNotFatal) {
  panel.ok = false;
  DisplaySink sink(panel, clock, params);

  sink.post(display::shutdown());
  EXPECT_TRUE(sink.hasShown());
  EXPECT_EQ(DisplayKind::SHUTDOWN, sink.shown().kind);
}

/*-----------------------------------------------------------------------------
  ConsolePanel
-----------------------------------------------------------------------------*/

TEST(ConsolePanel, PrintsOnlyChanges) {
  FILE* f = tmpfile();
  ASSERT_NE(nullptr, f);

  ConsolePanel panel(f);
  EXPECT_TRUE(panel.show("Scanning...", "Collected: 1"));
  EXPECT_TRUE(panel.show("Scanning...", "Collected: 1"));
  EXPECT_TRUE(panel.show("GPS:", "No Fix"));

  rewind(f);
  char buf[256] = {0};
  const size_t n = fread(buf, 1, sizeof(buf) - 1, f);
  fclose(f);

  EXPECT_EQ(std::string("[LCD] Scanning... | Collected: 1\n[LCD] GPS: | No Fix\n"),
            std::string(buf, n));
}
