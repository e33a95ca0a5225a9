/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-runtime.cpp
 * @brief The unit test for fbs-runtime module.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <signal.h>
#include <unistd.h>

#include "fbs-proc.hpp"
#include "fbs-runtime.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  fbs::Fbs_Runtime_Manager::maskSignals();

  fbs::Fbs_Runtime_Manager runtime{};
  int hup_count{};
  bool term_hook_run{};

  runtime.registerSignalHandlerHook(SIGHUP, [&hup_count](int signo) {
    std::cout << "handle signal " << signo << "\n";
    hup_count++;
  });

  runtime.registerSignalHandlerHook(SIGTERM, [&term_hook_run](int signo) {
    std::cout << "handle signal " << signo << "\n";
    term_hook_run = true;
  });

  fbs::Fbs_Proc signal_proc{"signal", []() {
                              std::this_thread::sleep_for(
                                  std::chrono::milliseconds(300));
                              kill(getpid(), SIGHUP);

                              std::this_thread::sleep_for(
                                  std::chrono::milliseconds(300));
                              kill(getpid(), SIGHUP);

                              std::this_thread::sleep_for(
                                  std::chrono::milliseconds(300));
                              kill(getpid(), SIGTERM);
                            }};

  signal_proc.exec();

  runtime.enterMainLoop();
  signal_proc.wait();

  EXPECT_TRUE(2 == hup_count);
  EXPECT_TRUE(term_hook_run);

  // exitMainLoop() from another thread ends a second run of the loop
  fbs::Fbs_Proc exit_proc{"exit", [&runtime]() {
                            std::this_thread::sleep_for(
                                std::chrono::milliseconds(300));
                            runtime.exitMainLoop();
                          }};

  exit_proc.exec();
  runtime.enterMainLoop();
  exit_proc.wait();

  EXPECT_TRUE(2 == hup_count);

  return RUN_ALL_TESTS();
}
