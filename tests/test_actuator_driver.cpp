#include <gtest/gtest.h>

#include "Fakes.h"
#include "actuators/ActuatorDriver.h"

class ActuatorDriverTest : public ::testing::Test {
protected:
  ManualClock clock;
  RecordingBoard board;
  ActuatorDriver driver{board, clock};
};

TEST_F(ActuatorDriverTest, RepeatedCommandsSendOnce) {
  EXPECT_EQ(ActuatorStatus::OK, driver.setPropulsion(60, 60));
  EXPECT_EQ(ActuatorStatus::OK, driver.setPropulsion(60, 60));
  EXPECT_EQ(1u, board.sent.size());

  EXPECT_EQ(ActuatorStatus::OK, driver.stopPropulsion());
  EXPECT_EQ(ActuatorStatus::OK, driver.stopPropulsion());
  EXPECT_EQ(2u, board.sent.size());
  EXPECT_EQ(2u, driver.framesSent());
}

TEST_F(ActuatorDriverTest, StoppedDriverSendsNothingForStop) {
  EXPECT_EQ(ActuatorStatus::OK, driver.stopPropulsion());
  EXPECT_EQ(ActuatorStatus::OK, driver.stopCollectionMechanism());
  EXPECT_TRUE(board.sent.empty());
}

TEST_F(ActuatorDriverTest, SpeedsAreClamped) {
  driver.setPropulsion(250, -180);
  ASSERT_EQ(1u, board.sent.size());
  EXPECT_EQ(100, board.sent[0].drive.left_pct);
  EXPECT_EQ(-100, board.sent[0].drive.right_pct);
}

TEST_F(ActuatorDriverTest, PropulsionRefusedWhileCollecting) {
  ASSERT_EQ(ActuatorStatus::OK, driver.startCollectionMechanism());
  const size_t before = board.sent.size();

  EXPECT_EQ(ActuatorStatus::INTERLOCKED, driver.setPropulsion(40, -40));
  EXPECT_EQ(before, board.sent.size());
  EXPECT_FALSE(driver.propulsionActive());

  // Stopping is never refused
  EXPECT_EQ(ActuatorStatus::OK, driver.stopPropulsion());
}

TEST_F(ActuatorDriverTest, CollectorStartStopsPropulsionFirst) {
  driver.setPropulsion(50, 50);
  ASSERT_EQ(ActuatorStatus::OK, driver.startCollectionMechanism());

  ASSERT_EQ(3u, board.sent.size());
  EXPECT_EQ(0, board.sent[1].drive.left_pct);
  EXPECT_EQ(CollectorMode::STOP, board.sent[1].mech.collector);
  EXPECT_EQ(0, board.sent[2].drive.left_pct);
  EXPECT_EQ(CollectorMode::RUN, board.sent[2].mech.collector);

  EXPECT_TRUE(driver.collectorRunning());
  EXPECT_FALSE(driver.propulsionActive());
}

TEST_F(ActuatorDriverTest, FailedSendKeepsCommandedState) {
  board.fail_on_call = 1;
  EXPECT_EQ(ActuatorStatus::LINK_ERROR, driver.startCollectionMechanism());
  EXPECT_FALSE(driver.collectorRunning());
  EXPECT_EQ(0u, driver.framesSent());

  // Same command goes out again on the next call
  EXPECT_EQ(ActuatorStatus::OK, driver.startCollectionMechanism());
  EXPECT_TRUE(driver.collectorRunning());
  EXPECT_EQ(2u, board.sent.size());
}

TEST_F(ActuatorDriverTest, FailedPropulsionStopAbortsCollectorStart) {
  driver.setPropulsion(30, 30);
  board.fail_on_call = 1;

  EXPECT_EQ(ActuatorStatus::LINK_ERROR, driver.startCollectionMechanism());
  EXPECT_EQ(2u, board.sent.size());
  EXPECT_FALSE(driver.collectorRunning());
  EXPECT_TRUE(driver.propulsionActive());
}

TEST_F(ActuatorDriverTest, MissingBoardReportsHardwareAbsent) {
  board.status = ActuatorStatus::HARDWARE_ABSENT;
  EXPECT_EQ(ActuatorStatus::HARDWARE_ABSENT, driver.setPropulsion(10, 10));
  EXPECT_FALSE(driver.propulsionActive());
}

TEST_F(ActuatorDriverTest, StopAllAlwaysSends) {
  driver.stopAll();
  driver.stopAll();
  ASSERT_EQ(2u, board.sent.size());
  EXPECT_TRUE(board.sent[0].allStopped());
  EXPECT_TRUE(board.sent[1].allStopped());
}

TEST_F(ActuatorDriverTest, StopAllClearsStateEvenWhenSendFails) {
  driver.startCollectionMechanism();
  board.status = ActuatorStatus::LINK_ERROR;

  driver.stopAll();
  EXPECT_TRUE(board.sent.back().allStopped());
  EXPECT_FALSE(driver.collectorRunning());
  EXPECT_FALSE(driver.propulsionActive());
}

TEST_F(ActuatorDriverTest, StopAfterFailedStopAllIsRetransmitted) {
  ASSERT_EQ(ActuatorStatus::OK, driver.startCollectionMechanism());
  board.status = ActuatorStatus::LINK_ERROR;

  EXPECT_EQ(ActuatorStatus::LINK_ERROR, driver.stopCollectionMechanism());
  driver.stopAll();
  EXPECT_FALSE(driver.stateConfirmed());

  // Link back: the stop must reach the board even though the commanded
  // state already says stopped
  board.status = ActuatorStatus::OK;
  const size_t before = board.sent.size();
  EXPECT_EQ(ActuatorStatus::OK, driver.stopCollectionMechanism());
  ASSERT_EQ(before + 1, board.sent.size());
  EXPECT_TRUE(board.sent.back().allStopped());
  EXPECT_TRUE(driver.stateConfirmed());

  // Confirmed again: repeats are skipped
  EXPECT_EQ(ActuatorStatus::OK, driver.stopCollectionMechanism());
  EXPECT_EQ(before + 1, board.sent.size());
}

TEST_F(ActuatorDriverTest, AcceptedStopAllConfirmsState) {
  board.fail_on_call = 1;
  EXPECT_EQ(ActuatorStatus::LINK_ERROR, driver.setPropulsion(20, 20));
  EXPECT_FALSE(driver.stateConfirmed());

  driver.stopAll();
  EXPECT_TRUE(driver.stateConfirmed());
}

TEST(ActuatorStatusName, NamesEveryStatus) {
  EXPECT_STREQ("OK", actuatorStatusName(ActuatorStatus::OK));
  EXPECT_STREQ("LINK_ERROR", actuatorStatusName(ActuatorStatus::LINK_ERROR));
  EXPECT_STREQ("INTERLOCKED", actuatorStatusName(ActuatorStatus::INTERLOCKED));
}
