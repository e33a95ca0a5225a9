/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-server-no-cache.cpp
 * @brief The unit test for fbs-server module with the reply cache off: a
 *        retransmitted request runs again, so a duplicated book fails on
 *        its own booking and a duplicated shift moves the booking twice.
 */

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "fbs-codec.hpp"
#include "fbs-config.hpp"
#include "fbs-message.hpp"
#include "fbs-pipe.hpp"
#include "fbs-server.hpp"
#include "fbs-socket.hpp"
#include "fbs-time.hpp"

namespace {

const fbs::Fbs_Address kClient{"127.0.0.1", 7101};

auto exchange(fbs::Fbs_Pipe<fbs::Fbs_Datagram> &input,
              fbs::Fbs_Pipe<fbs::Fbs_Datagram> &output,
              const std::string &payload) -> fbs::Fbs_Reply {
  input.write(fbs::Fbs_Datagram{kClient, payload});

  auto datagram = output.read();
  EXPECT_TRUE(datagram);

  auto message = fbs::decode(datagram->payload);
  EXPECT_TRUE(message);
  EXPECT_TRUE(std::holds_alternative<fbs::Fbs_Reply>(*message));

  return std::get<fbs::Fbs_Reply>(*message);
}

} // namespace

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  fbs::Fbs_Server_Config config{};
  config.use_reply_cache = false;
  config.workers = 1;
  config.seed = 100;

  fbs::Fbs_Pipe<fbs::Fbs_Datagram> input{"input"};
  fbs::Fbs_Pipe<fbs::Fbs_Datagram> output{"output"};
  fbs::Fbs_Server server{config, input, output};

  const fbs::Fbs_Request_Id book_id{0x1234, 1};
  const auto book = fbs::encode(fbs::Fbs_Request{
      book_id, fbs::Fbs_Book_Request{
                   "Gym", fbs::Fbs_Interval{fbs::Fbs_Time_Point{2, 18, 0},
                                            fbs::Fbs_Time_Point{2, 19, 0}}}});

  auto first = exchange(input, output, book);
  EXPECT_TRUE(fbs::Fbs_Status::kSuccess == first.status);
  EXPECT_TRUE(101 == std::get<fbs::Fbs_Book_Reply>(first.body).booking_id);

  auto second = exchange(input, output, book);
  EXPECT_TRUE(book_id == second.id);
  EXPECT_TRUE(fbs::Fbs_Status::kOverlap == second.status);

  const auto shift = fbs::encode(fbs::Fbs_Request{
      fbs::Fbs_Request_Id{0x1234, 2}, fbs::Fbs_Shift_Request{101, 30}});

  auto shifted_once = exchange(input, output, shift);
  auto shifted_twice = exchange(input, output, shift);
  EXPECT_TRUE(fbs::Fbs_Status::kSuccess == shifted_once.status);
  EXPECT_TRUE(fbs::Fbs_Status::kSuccess == shifted_twice.status);
  EXPECT_TRUE((fbs::Fbs_Interval{fbs::Fbs_Time_Point{2, 19, 0},
                                 fbs::Fbs_Time_Point{2, 20, 0}} ==
               std::get<fbs::Fbs_Interval_Reply>(shifted_twice.body).interval));

  auto record = server.getStore().getBooking(101);
  EXPECT_TRUE(record);
  EXPECT_TRUE((fbs::Fbs_Time_Point{2, 19, 0} == record->interval.start));

  const auto stats = server.getStats();
  EXPECT_TRUE(4 == stats.executed);
  EXPECT_TRUE(0 == stats.replayed);
  EXPECT_TRUE(0 == server.getReplyCache().size());

  return RUN_ALL_TESTS();
}
