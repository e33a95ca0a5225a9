/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-client.cpp
 * @brief The unit test for fbs-client module against a server, wired
 *        together by two pipes: every operation, monitoring, and requests
 *        duplicated on the way to the server.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

#include "fbs-client.hpp"
#include "fbs-config.hpp"
#include "fbs-message.hpp"
#include "fbs-pipe.hpp"
#include "fbs-proc.hpp"
#include "fbs-server.hpp"
#include "fbs-sim-transport.hpp"
#include "fbs-socket.hpp"
#include "fbs-time.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  fbs::Fbs_Server_Config server_config{};
  server_config.seed = 0;

  fbs::Fbs_Client_Config client_config{};
  client_config.timeout = std::chrono::milliseconds{500};
  client_config.retries = 2;
  client_config.client_id = 0x42;

  fbs::Fbs_Pipe<fbs::Fbs_Datagram> to_server{"to-server"};
  fbs::Fbs_Pipe<fbs::Fbs_Datagram> to_client{"to-client"};
  fbs::Fbs_Server server{server_config, to_server, to_client};

  const fbs::Fbs_Interval morning{fbs::Fbs_Time_Point{0, 9, 0},
                                  fbs::Fbs_Time_Point{0, 10, 0}};

  {
    fbs::Fbs_Client client{client_config, to_client, to_server};

    EXPECT_TRUE(0x42 == client.getClientId());
    const auto first_seq = client.getLastSeq() + 1;
    EXPECT_TRUE(first_seq > 1);

    auto booked = client.book("Room101", morning);
    EXPECT_TRUE(booked);
    EXPECT_TRUE(fbs::Fbs_Status::kSuccess == booked->status);
    const auto booking_id = std::get<fbs::Fbs_Book_Reply>(booked->body).booking_id;
    EXPECT_TRUE(1 == booking_id);
    EXPECT_TRUE(first_seq == client.getLastSeq());
    EXPECT_TRUE(1 == client.getSendCount());

    // an error status is still a reply
    auto clash = client.book("Room101", morning);
    EXPECT_TRUE(clash);
    EXPECT_TRUE(fbs::Fbs_Status::kOverlap == clash->status);
    EXPECT_FALSE(clash->errorMessage().empty());

    auto no_room = client.queryAvailability("Room999", {0});
    EXPECT_TRUE(no_room && fbs::Fbs_Status::kFacilityNotFound == no_room->status);

    auto shifted = client.shift(booking_id, 120);
    EXPECT_TRUE(shifted && fbs::Fbs_Status::kSuccess == shifted->status);
    EXPECT_TRUE((fbs::Fbs_Interval{fbs::Fbs_Time_Point{0, 11, 0},
                                   fbs::Fbs_Time_Point{0, 12, 0}} ==
                 std::get<fbs::Fbs_Interval_Reply>(shifted->body).interval));

    auto extended = client.extend(booking_id, 30);
    EXPECT_TRUE(extended && fbs::Fbs_Status::kSuccess == extended->status);

    auto record = client.getBooking(booking_id);
    EXPECT_TRUE(record && fbs::Fbs_Status::kSuccess == record->status);
    const auto &booking = std::get<fbs::Fbs_Booking_Record>(record->body);
    EXPECT_TRUE(0x42 == booking.client_id);
    EXPECT_TRUE((fbs::Fbs_Interval{fbs::Fbs_Time_Point{0, 11, 0},
                                   fbs::Fbs_Time_Point{0, 12, 30}} ==
                 booking.interval));

    auto days = client.queryAvailability("Room101", {0, 1});
    EXPECT_TRUE(days && fbs::Fbs_Status::kSuccess == days->status);
    const auto &query = std::get<fbs::Fbs_Query_Reply>(days->body);
    EXPECT_TRUE(2 == query.days.size());
    EXPECT_TRUE(1 == query.days[0].intervals.size());
    EXPECT_TRUE(query.days[1].intervals.empty());

    auto unknown = client.getBooking(0xdead);
    EXPECT_TRUE(unknown && fbs::Fbs_Status::kBookingNotFound == unknown->status);

    // monitoring: a booking made while the window is open is delivered
    std::mutex events_mutex{};
    std::vector<fbs::Fbs_Event> events{};

    fbs::Fbs_Proc booker{"booker", [&server, &morning]() {
                           std::this_thread::sleep_for(
                               std::chrono::milliseconds(500));

                           auto later = morning.shiftedBy(24 * 60);
                           EXPECT_TRUE(later);
                           EXPECT_TRUE(
                               server.getStore().book("Room101", *later));
                         }};
    booker.exec();

    const auto started = std::chrono::steady_clock::now();
    auto monitored = client.monitor(
        "Room101", std::chrono::seconds{2},
        [&events_mutex, &events](const fbs::Fbs_Event &event) {
          std::lock_guard<std::mutex> lock(events_mutex);

          events.push_back(event);
        });
    const auto elapsed = std::chrono::steady_clock::now() - started;
    booker.wait();

    EXPECT_TRUE(monitored && fbs::Fbs_Status::kSuccess == monitored->status);
    EXPECT_TRUE(2 == std::get<fbs::Fbs_Monitor_Reply>(monitored->body)
                         .duration_sec);
    EXPECT_TRUE(elapsed >= std::chrono::seconds{2});

    {
      std::lock_guard<std::mutex> lock(events_mutex);

      EXPECT_TRUE(1 == events.size());
      EXPECT_TRUE(fbs::Fbs_Mutation_Kind::kBooked == events[0].mutation.kind);
      EXPECT_TRUE("Room101" == events[0].mutation.facility);
    }

    // a refused subscription returns at once
    auto refused = client.monitor("Room999", std::chrono::seconds{60},
                                  [](const fbs::Fbs_Event &) {});
    EXPECT_TRUE(refused &&
                fbs::Fbs_Status::kFacilityNotFound == refused->status);

    // sequence numbers only grow
    EXPECT_TRUE(first_seq + 9 == client.getLastSeq());
  }

  // a second run with the same client id is not answered from the replies
  // cached for the first one
  {
    fbs::Fbs_Client client{client_config, to_client, to_server};

    const auto executed_before = server.getStats().executed;
    const auto replayed_before = server.getStats().replayed;

    auto booked = client.book(
        "Room102", fbs::Fbs_Interval{fbs::Fbs_Time_Point{4, 9, 0},
                                     fbs::Fbs_Time_Point{4, 10, 0}});
    EXPECT_TRUE(booked && fbs::Fbs_Status::kSuccess == booked->status);
    EXPECT_TRUE(3 == std::get<fbs::Fbs_Book_Reply>(booked->body).booking_id);

    server.waitForIdle();
    EXPECT_TRUE(executed_before + 1 == server.getStats().executed);
    EXPECT_TRUE(replayed_before == server.getStats().replayed);

    auto bookings = server.getStore().getBookings("Room102");
    EXPECT_TRUE(bookings && 1 == bookings->size());
  }

  // every request reaches the server several times, the booking is made once
  {
    client_config.client_id = 0x43;

    fbs::Fbs_Sim_Transport duplicating{
        to_server, fbs::Fbs_Sim_Config{0.0, 1.0, false, 3}};
    fbs::Fbs_Client client{client_config, to_client, duplicating};

    const auto replayed_before = server.getStats().replayed;

    auto booked = client.book(
        "Gym", fbs::Fbs_Interval{fbs::Fbs_Time_Point{5, 8, 0},
                                 fbs::Fbs_Time_Point{5, 9, 0}});
    EXPECT_TRUE(booked && fbs::Fbs_Status::kSuccess == booked->status);

    auto after = client.queryAvailability("Gym", {5});
    EXPECT_TRUE(after && fbs::Fbs_Status::kSuccess == after->status);
    EXPECT_TRUE(1 == std::get<fbs::Fbs_Query_Reply>(after->body)
                         .days[0]
                         .intervals.size());

    server.waitForIdle();
    EXPECT_TRUE(server.getStats().replayed - replayed_before ==
                fbs::kFbsMaxDuplicateCopies - 1);
    EXPECT_TRUE(2 == client.getSendCount());
  }

  return RUN_ALL_TESTS();
}
