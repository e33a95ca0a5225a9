/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-monitor.cpp
 * @brief The unit test for fbs-monitor module: subscriptions receive the
 *        mutation events of their facility until they expire.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <variant>

#include "fbs-codec.hpp"
#include "fbs-facility.hpp"
#include "fbs-monitor.hpp"
#include "fbs-pipe.hpp"
#include "fbs-socket.hpp"
#include "fbs-time.hpp"

namespace {

auto nextEvent(fbs::Fbs_Pipe<fbs::Fbs_Datagram> &output,
               const fbs::Fbs_Address &expected_peer) -> fbs::Fbs_Event {
  auto datagram = output.read();
  EXPECT_TRUE(datagram);
  EXPECT_TRUE(expected_peer == datagram->peer);

  auto message = fbs::decode(datagram->payload);
  EXPECT_TRUE(message);
  EXPECT_TRUE(std::holds_alternative<fbs::Fbs_Event>(*message));

  return std::get<fbs::Fbs_Event>(*message);
}

} // namespace

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  const fbs::Fbs_Address alice{"127.0.0.1", 6001};
  const fbs::Fbs_Address bob{"127.0.0.1", 6002};
  const fbs::Fbs_Interval morning{fbs::Fbs_Time_Point{0, 9, 0},
                                  fbs::Fbs_Time_Point{0, 10, 0}};

  fbs::Fbs_Pipe<fbs::Fbs_Datagram> output{"output"};
  fbs::Fbs_Facility_Store store{{"Room101", "Gym"}, 0};
  fbs::Fbs_Monitor_Registry registry{store, output, std::chrono::seconds{60}};

  store.setMutationListener([&registry](const fbs::Fbs_Mutation_Event &event) {
    registry.onMutation(event);
  });

  auto no_room = registry.subscribe("Room999", alice, std::chrono::seconds{5});
  EXPECT_TRUE(!no_room && fbs::Fbs_Status::kFacilityNotFound == no_room.error());

  auto zero = registry.subscribe("Room101", alice, std::chrono::seconds{0});
  EXPECT_TRUE(!zero && fbs::Fbs_Status::kInvalidRequest == zero.error());

  auto too_long = registry.subscribe("Room101", alice, std::chrono::seconds{61});
  EXPECT_TRUE(!too_long && fbs::Fbs_Status::kInvalidRequest == too_long.error());

  EXPECT_TRUE(0 == registry.getSubscriberCount("Room101"));

  // nobody listens yet
  EXPECT_TRUE(store.book("Room101", morning));
  EXPECT_TRUE(0 == registry.getPushCount());

  auto alice_expiry =
      registry.subscribe("Room101", alice, std::chrono::seconds{1});
  EXPECT_TRUE(alice_expiry);
  EXPECT_TRUE(registry.subscribe("Room101", bob, std::chrono::seconds{30}));

  // a renewed subscription is still one subscriber
  auto renewed = registry.subscribe("Room101", alice, std::chrono::seconds{1});
  EXPECT_TRUE(renewed && *renewed >= *alice_expiry);
  EXPECT_TRUE(2 == registry.getSubscriberCount("Room101"));

  auto booking_id = store.book(
      "Room101", fbs::Fbs_Interval{fbs::Fbs_Time_Point{1, 9, 0},
                                   fbs::Fbs_Time_Point{1, 10, 0}});
  EXPECT_TRUE(booking_id);
  EXPECT_TRUE(2 == registry.getPushCount());

  auto to_alice = nextEvent(output, alice);
  auto to_bob = nextEvent(output, bob);
  EXPECT_TRUE(to_alice.seq == to_bob.seq);
  EXPECT_TRUE(to_alice.mutation == to_bob.mutation);
  EXPECT_TRUE("Room101" == to_alice.mutation.facility);
  EXPECT_TRUE(fbs::Fbs_Mutation_Kind::kBooked == to_alice.mutation.kind);
  EXPECT_TRUE(*booking_id == to_alice.mutation.booking_id);

  // other facilities are not pushed
  EXPECT_TRUE(store.book("Gym", morning));
  EXPECT_TRUE(2 == registry.getPushCount());

  // once alice's window is over only bob hears about the shift
  std::this_thread::sleep_for(std::chrono::milliseconds(1200));
  EXPECT_TRUE(1 == registry.getSubscriberCount("Room101"));

  EXPECT_TRUE(store.shift(*booking_id, 60));
  EXPECT_TRUE(3 == registry.getPushCount());

  auto shifted = nextEvent(output, bob);
  EXPECT_TRUE(shifted.seq > to_bob.seq);
  EXPECT_TRUE(fbs::Fbs_Mutation_Kind::kShifted == shifted.mutation.kind);
  EXPECT_TRUE(shifted.mutation.previous);
  EXPECT_FALSE(output.popNoWait());

  EXPECT_TRUE(0 == registry.purgeExpired());
  EXPECT_TRUE(registry.subscribe("Gym", alice, std::chrono::seconds{1}));
  std::this_thread::sleep_for(std::chrono::milliseconds(1100));
  EXPECT_TRUE(1 == registry.purgeExpired());
  EXPECT_TRUE(0 == registry.getSubscriberCount("Gym"));

  return RUN_ALL_TESTS();
}
