/**
 * @file test_readiness_watcher.cpp
 * @brief Readiness polling against a simulated clock.
 */

#include <gtest/gtest.h>

#include "device_error.hpp"
#include "fakes.hpp"
#include "readiness_watcher.hpp"

using std::chrono::seconds;

TEST(ReadinessWatcherTest, ReadyOnFirstProbeDoesNotSleep) {
  FakeRemoteShell shell;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  EXPECT_EQ(watcher.wait_ready(22405), seconds(0));
  EXPECT_EQ(shell.probeCalls, 1);
  EXPECT_EQ(sleeper.calls, 0);
}

TEST(ReadinessWatcherTest, RetriesEveryInterval) {
  FakeRemoteShell shell;
  shell.readyAfter = 3;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  EXPECT_EQ(watcher.wait_ready(22405), seconds(15));
  EXPECT_EQ(shell.probeCalls, 4);
  EXPECT_EQ(sleeper.calls, 3);
  EXPECT_EQ(sleeper.total, seconds(15));
}

TEST(ReadinessWatcherTest, ProbeUsesShortConnectTimeout) {
  FakeRemoteShell shell;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  watcher.wait_ready(22405);

  EXPECT_EQ(shell.lastConnectTimeout, seconds(5));
}

TEST(ReadinessWatcherTest, ReadyJustBeforeDeadline) {
  FakeRemoteShell shell;
  shell.readyAfter = 11;   // answers on the probe made at 55s
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  EXPECT_EQ(watcher.wait_ready(22405), seconds(55));
}

TEST(ReadinessWatcherTest, TimesOutOnceTimeoutElapsed) {
  FakeRemoteShell shell;
  shell.readyAfter = -1;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  try {
    watcher.wait_ready(22405);
    FAIL() << "expected Timeout";
  } catch (const DeviceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Timeout);
  }
  EXPECT_EQ(shell.probeCalls, 12);
  EXPECT_EQ(sleeper.total, seconds(60));
}

TEST(ReadinessWatcherTest, DeadlineNotMultipleOfInterval) {
  FakeRemoteShell shell;
  shell.readyAfter = -1;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  EXPECT_THROW(watcher.wait_ready(22405, seconds(10), seconds(3)), DeviceError);
  // Probes at 0, 3, 6 and 9 seconds.
  EXPECT_EQ(shell.probeCalls, 4);
  EXPECT_EQ(sleeper.total, seconds(12));
}

TEST(ReadinessWatcherTest, ForgetsHostKeyBeforeFirstProbe) {
  FakeRemoteShell shell;
  shell.readyAfter = 1;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  watcher.wait_ready(22417);

  const std::vector<std::string> expected = {"forget:22417", "probe:22417", "probe:22417"};
  EXPECT_EQ(shell.events, expected);
}

TEST(ReadinessWatcherTest, NonPositiveIntervalIsRejected) {
  FakeRemoteShell shell;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  EXPECT_THROW(watcher.wait_ready(22405, seconds(60), seconds(0)), UsageError);
  EXPECT_EQ(shell.probeCalls, 0);
}

TEST(ReadinessWatcherTest, FailingHostKeyRemovalStillPolls) {
  FakeRemoteShell shell;
  shell.throwOnForget = true;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  EXPECT_EQ(watcher.wait_ready(22400), seconds(0));
  EXPECT_EQ(shell.probeCalls, 1);
}

TEST(ReadinessWatcherTest, ThrowingAttemptCountsAsFailed) {
  FakeRemoteShell shell;
  shell.throwingProbes = 2;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  EXPECT_EQ(watcher.wait_ready(22400), seconds(10));
  EXPECT_EQ(shell.probeCalls, 3);
}

TEST(ReadinessWatcherTest, AttemptsThatAlwaysThrowEndInTimeout) {
  FakeRemoteShell shell;
  shell.throwingProbes = 1000;
  FakeSleeper sleeper;
  ReadinessWatcher watcher(shell, sleeper);

  try {
    watcher.wait_ready(22400);
    FAIL() << "expected Timeout";
  } catch (const DeviceError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    EXPECT_NE(std::string(e.what()).find("Executable not found: ssh"), std::string::npos);
  }
  EXPECT_EQ(shell.probeCalls, 12);
}
