/**
 * @file test_log.cpp
 * @brief Status line formatting.
 */

#include <gtest/gtest.h>

#include <string>

#include "log.hpp"

TEST(LogTest, ColourCanBeForcedOnAndOff) {
  set_log_color(false);
  testing::internal::CaptureStdout();
  log_success("Device is up");
  EXPECT_EQ(testing::internal::GetCapturedStdout(), "Device is up\n");

  set_log_color(true);
  testing::internal::CaptureStdout();
  log_success("Device is up");
  EXPECT_EQ(testing::internal::GetCapturedStdout(), "\033[0;32mDevice is up\033[0m\n");

  set_log_color(false);
}
