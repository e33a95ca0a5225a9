/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-buffer.cpp
 * @brief The unit test for fbs-buffer module.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fbs-buffer.hpp"
#include "fbs-proc.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);
  using namespace std::string_literals;

  auto buf = std::make_unique<fbs::Fbs_Buffer<std::string>>();
  std::vector<std::string> popped{};

  auto proc = std::make_unique<fbs::Fbs_Proc>("proc", [&buf, &popped]() {
    auto s = buf->pop();
    popped.push_back(s);
    std::cout << "value pop: " << s << "\n";
  });

  std::string value{"hello"};

  buf->push(value);
  EXPECT_TRUE(value == "");

  proc->exec();
  proc->wait();

  buf->push("abc"s);

  proc->exec();
  proc->wait();

  EXPECT_TRUE(2 == popped.size());
  EXPECT_TRUE("hello" == popped[0]);
  EXPECT_TRUE("abc" == popped[1]);

  // a proc blocked in pop() on an empty buffer can be cancelled
  proc->exec();
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  proc = {};
  buf = {};

  fbs::Fbs_Buffer<int> int_buf{};
  int_buf.push(2);

  EXPECT_TRUE(2 == int_buf.pop());
  EXPECT_TRUE(!int_buf.popNoWait());

  fbs::Fbs_Buffer<std::string> string_not_move_buf{};
  std::string string_to_not_move{"not move"};
  string_not_move_buf.push(string_to_not_move, false);
  std::string string_from_buf = string_not_move_buf.pop();

  EXPECT_TRUE("not move" == string_from_buf);
  EXPECT_TRUE("not move" == string_to_not_move);

  // pop(count, timeout) returns what is there once the timeout expires
  fbs::Fbs_Buffer<int> batch_buf{};
  batch_buf.push(1);
  batch_buf.push(2);

  auto start = std::chrono::steady_clock::now();
  auto batch = batch_buf.pop(5, 100000);
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(2 == batch.size());
  EXPECT_TRUE(1 == batch[0] && 2 == batch[1]);
  EXPECT_TRUE(elapsed >= std::chrono::milliseconds(90));

  batch_buf.push(3);
  batch_buf.push(4);
  batch_buf.push(5);
  batch = batch_buf.pop(2);
  EXPECT_TRUE(2 == batch.size());
  EXPECT_TRUE(3 == batch[0] && 4 == batch[1]);
  EXPECT_TRUE(5 == batch_buf.pop());

  EXPECT_TRUE(5 == batch_buf.waitForEmpty());

  return RUN_ALL_TESTS();
}
