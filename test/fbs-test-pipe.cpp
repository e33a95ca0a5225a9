/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-pipe.cpp
 * @brief The unit test for fbs-pipe module, with a processing task and as
 *        a loopback endpoint of datagrams.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "fbs-io.hpp"
#include "fbs-pipe.hpp"
#include "fbs-proc.hpp"
#include "fbs-socket.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  bool read_done_once{};
  int cnt{};
  fbs::Fbs_Pipe<int> pipe{"pipe",
                          [&cnt, &read_done_once](int val) {
                            EXPECT_TRUE(val == cnt);

                            cnt++;
                            read_done_once = true;
                          },
                          3};

  fbs::Fbs_Proc::yield();

  pipe.write(0);
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_TRUE(!read_done_once);

  pipe.write(1);
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_TRUE(!read_done_once);

  pipe.write(2);
  pipe.waitForEmpty();
  EXPECT_TRUE(read_done_once);
  EXPECT_TRUE(3 == cnt);

  // without a task the pipe is a plain endpoint
  fbs::Fbs_Pipe<fbs::Fbs_Datagram> loopback{"loopback"};
  fbs::Fbs_Io<fbs::Fbs_Datagram> &endpoint = loopback;

  fbs::Fbs_Datagram datagram{fbs::Fbs_Address{"127.0.0.1", 4000}, "payload"};
  endpoint.write(datagram);
  EXPECT_TRUE("payload" == datagram.payload);

  endpoint.write(fbs::Fbs_Datagram{fbs::Fbs_Address{"127.0.0.1", 4001}, "x"});

  auto first = endpoint.read();
  auto second = endpoint.read();

  EXPECT_TRUE(first && second);
  EXPECT_TRUE(4000 == first->peer.port && "payload" == first->payload);
  EXPECT_TRUE(4001 == second->peer.port && "x" == second->payload);

  endpoint.write(datagram);
  endpoint.write(datagram);
  auto both = loopback.read(2, 100000);
  EXPECT_TRUE(2 == both.size());

  return RUN_ALL_TESTS();
}
