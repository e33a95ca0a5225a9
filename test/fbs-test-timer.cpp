/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-timer.cpp
 * @brief The unit test for fbs-timer module.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "fbs-timer.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  std::atomic<int> count{};
  fbs::Fbs_Timer<std::chrono::milliseconds> timer{
      std::chrono::milliseconds(100), [&count]() { count++; }};

  std::this_thread::sleep_for(std::chrono::milliseconds(550));
  timer.stop();

  const int count_at_stop = count;
  EXPECT_TRUE(count_at_stop >= 3);
  EXPECT_TRUE(count_at_stop <= 6);

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_TRUE(count_at_stop == count);

  // restart with a new callback that throws every other time
  std::atomic<int> runs{};
  timer.start(std::chrono::milliseconds(50), [&runs]() {
    if (runs++ % 2 == 0) {
      throw std::runtime_error("every other run fails");
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(400));
  timer.stop();

  EXPECT_TRUE(runs >= 4);
  EXPECT_TRUE(count_at_stop == count);

  return RUN_ALL_TESTS();
}
