/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-codec.cpp
 * @brief The unit test for fbs-codec module: the datagram framing, each
 *        message kind, and the rejection of malformed datagrams.
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

#include "fbs-codec.hpp"
#include "fbs-message.hpp"
#include "fbs-time.hpp"
#include "proto/fbs-wire.pb.h"

namespace {

const fbs::Fbs_Request_Id kId{0x0102030405060708ULL, 42};

const fbs::Fbs_Interval kInterval{fbs::Fbs_Time_Point{0, 9, 0},
                                  fbs::Fbs_Time_Point{0, 10, 30}};

auto roundTrip(const fbs::Fbs_Request &request) -> fbs::Fbs_Request {
  auto message = fbs::decode(fbs::encode(request));
  EXPECT_TRUE(message);
  EXPECT_TRUE(std::holds_alternative<fbs::Fbs_Request>(*message));

  return std::get<fbs::Fbs_Request>(*message);
}

auto roundTrip(const fbs::Fbs_Reply &reply) -> fbs::Fbs_Reply {
  auto message = fbs::decode(fbs::encode(reply));
  EXPECT_TRUE(message);
  EXPECT_TRUE(std::holds_alternative<fbs::Fbs_Reply>(*message));

  return std::get<fbs::Fbs_Reply>(*message);
}

/**
 * A datagram with a hand-built header in front of @p body.
 */
auto frame(uint8_t kind, uint8_t code, const std::string &body,
           size_t body_len) -> std::string {
  std::string out{};

  out.push_back(static_cast<char>(kind));
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((kId.client_id >> shift) & 0xff));
  }

  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<char>((kId.seq >> shift) & 0xff));
  }

  out.push_back(static_cast<char>(code));
  out.push_back(static_cast<char>((body_len >> 8) & 0xff));
  out.push_back(static_cast<char>(body_len & 0xff));

  return out + body;
}

auto frame(uint8_t kind, uint8_t code, const std::string &body)
    -> std::string {
  return frame(kind, code, body, body.size());
}

void testHeader() {
  const auto bytes = fbs::encode(
      fbs::Fbs_Request{kId, fbs::Fbs_Get_Booking_Request{0xabcdef}});

  EXPECT_TRUE(bytes.size() > fbs::kFbsHeaderSize);
  EXPECT_TRUE(1 == static_cast<uint8_t>(bytes[0]));
  EXPECT_TRUE(0x01 == static_cast<uint8_t>(bytes[1]));
  EXPECT_TRUE(0x08 == static_cast<uint8_t>(bytes[8]));
  EXPECT_TRUE(42 == static_cast<uint8_t>(bytes[16]));
  EXPECT_TRUE(5 == static_cast<uint8_t>(bytes[17]));

  auto header = fbs::decodeHeader(bytes);
  EXPECT_TRUE(header);
  EXPECT_TRUE(fbs::Fbs_Message_Kind::kRequest == header->kind);
  EXPECT_TRUE(kId.client_id == header->client_id);
  EXPECT_TRUE(kId.seq == header->seq);
  EXPECT_TRUE(static_cast<uint8_t>(fbs::Fbs_Opcode::kGetBooking) ==
              header->code);
  EXPECT_TRUE(bytes.size() - fbs::kFbsHeaderSize == header->body_len);
}

void testRequests() {
  auto query = roundTrip(fbs::Fbs_Request{
      kId, fbs::Fbs_Query_Request{"Room101", {0, 2, 4}}});
  EXPECT_TRUE(kId == query.id);
  EXPECT_TRUE(fbs::Fbs_Opcode::kQueryAvailability == query.opcode());
  const auto &query_body = std::get<fbs::Fbs_Query_Request>(query.body);
  EXPECT_TRUE("Room101" == query_body.facility);
  EXPECT_TRUE((std::vector<uint32_t>{0, 2, 4} == query_body.days));

  auto book = roundTrip(
      fbs::Fbs_Request{kId, fbs::Fbs_Book_Request{"Gym", kInterval}});
  EXPECT_TRUE(fbs::Fbs_Opcode::kBook == book.opcode());
  EXPECT_TRUE(kInterval == std::get<fbs::Fbs_Book_Request>(book.body).interval);

  auto shift = roundTrip(
      fbs::Fbs_Request{kId, fbs::Fbs_Shift_Request{0xffffffffffffffffULL, -90}});
  const auto &shift_body = std::get<fbs::Fbs_Shift_Request>(shift.body);
  EXPECT_TRUE(0xffffffffffffffffULL == shift_body.booking_id);
  EXPECT_TRUE(-90 == shift_body.offset_minutes);

  auto monitor = roundTrip(
      fbs::Fbs_Request{kId, fbs::Fbs_Monitor_Request{"LectureTheatre", 60}});
  EXPECT_TRUE(fbs::Fbs_Opcode::kMonitor == monitor.opcode());
  EXPECT_TRUE(60 ==
              std::get<fbs::Fbs_Monitor_Request>(monitor.body).duration_sec);

  auto extend =
      roundTrip(fbs::Fbs_Request{kId, fbs::Fbs_Extend_Request{7, 30}});
  EXPECT_TRUE(fbs::Fbs_Opcode::kExtend == extend.opcode());
  EXPECT_TRUE(30 == std::get<fbs::Fbs_Extend_Request>(extend.body).minutes);

  // an inverted interval is left for the booking engine to reject
  const fbs::Fbs_Interval inverted{kInterval.end, kInterval.start};
  auto inverted_book = roundTrip(
      fbs::Fbs_Request{kId, fbs::Fbs_Book_Request{"Gym", inverted}});
  EXPECT_TRUE(inverted ==
              std::get<fbs::Fbs_Book_Request>(inverted_book.body).interval);
}

void testReplies() {
  auto query = roundTrip(fbs::Fbs_Reply{
      kId, fbs::Fbs_Status::kSuccess,
      fbs::Fbs_Query_Reply{{fbs::Fbs_Day_Bookings{0, {kInterval}},
                            fbs::Fbs_Day_Bookings{3, {}}}}});
  EXPECT_TRUE(kId == query.id);
  EXPECT_TRUE(fbs::Fbs_Status::kSuccess == query.status);
  const auto &days = std::get<fbs::Fbs_Query_Reply>(query.body).days;
  EXPECT_TRUE(2 == days.size());
  EXPECT_TRUE((fbs::Fbs_Day_Bookings{0, {kInterval}} == days[0]));
  EXPECT_TRUE(3 == days[1].day && days[1].intervals.empty());

  auto book = roundTrip(fbs::Fbs_Reply{kId, fbs::Fbs_Status::kSuccess,
                                       fbs::Fbs_Book_Reply{99}});
  EXPECT_TRUE(99 == std::get<fbs::Fbs_Book_Reply>(book.body).booking_id);

  auto interval = roundTrip(fbs::Fbs_Reply{
      kId, fbs::Fbs_Status::kSuccess, fbs::Fbs_Interval_Reply{kInterval}});
  EXPECT_TRUE(kInterval ==
              std::get<fbs::Fbs_Interval_Reply>(interval.body).interval);

  auto monitor = roundTrip(fbs::Fbs_Reply{kId, fbs::Fbs_Status::kSuccess,
                                          fbs::Fbs_Monitor_Reply{30}});
  EXPECT_TRUE(30 ==
              std::get<fbs::Fbs_Monitor_Reply>(monitor.body).duration_sec);

  const fbs::Fbs_Booking_Record record{5, "Room102", kInterval, 0x77};
  auto booking = roundTrip(
      fbs::Fbs_Reply{kId, fbs::Fbs_Status::kSuccess, record});
  EXPECT_TRUE(record == std::get<fbs::Fbs_Booking_Record>(booking.body));

  auto error = roundTrip(fbs::Fbs_Reply::error(
      kId, fbs::Fbs_Status::kOverlap, "interval overlaps"));
  EXPECT_TRUE(fbs::Fbs_Status::kOverlap == error.status);
  EXPECT_TRUE("interval overlaps" == error.errorMessage());
}

void testEvent() {
  const fbs::Fbs_Event event{
      17, fbs::Fbs_Mutation_Event{
              "Room101", fbs::Fbs_Mutation_Kind::kShifted, 3,
              *kInterval.shiftedBy(60), kInterval}};

  auto message = fbs::decode(fbs::encode(event));
  EXPECT_TRUE(message);
  EXPECT_TRUE(std::holds_alternative<fbs::Fbs_Event>(*message));

  const auto &decoded = std::get<fbs::Fbs_Event>(*message);
  EXPECT_TRUE(17 == decoded.seq);
  EXPECT_TRUE(event.mutation == decoded.mutation);

  const fbs::Fbs_Event booked{
      18, fbs::Fbs_Mutation_Event{"Gym", fbs::Fbs_Mutation_Kind::kBooked, 4,
                                  kInterval, std::nullopt}};
  auto booked_message = fbs::decode(fbs::encode(booked));
  EXPECT_TRUE(booked_message);
  EXPECT_FALSE(std::get<fbs::Fbs_Event>(*booked_message).mutation.previous);
}

void testMalformed() {
  const auto valid = fbs::encode(
      fbs::Fbs_Request{kId, fbs::Fbs_Book_Request{"Gym", kInterval}});

  // shorter than a header: nothing to reply to
  auto truncated_header = fbs::decode(valid.substr(0, 10));
  EXPECT_FALSE(truncated_header);
  EXPECT_FALSE(truncated_header.error().header);
  EXPECT_FALSE(fbs::decodeHeader(valid.substr(0, 10)));

  // body shorter than announced, the header is still usable
  auto truncated_body = fbs::decode(valid.substr(0, valid.size() - 1));
  EXPECT_FALSE(truncated_body);
  EXPECT_TRUE(truncated_body.error().header);
  EXPECT_TRUE(kId.seq == truncated_body.error().header->seq);

  auto trailing = fbs::decode(valid + "x");
  EXPECT_FALSE(trailing);

  std::string bad_kind = valid;
  bad_kind[0] = 9;
  EXPECT_FALSE(fbs::decode(bad_kind));
  EXPECT_FALSE(fbs::decodeHeader(bad_kind));

  std::string bad_opcode = valid;
  bad_opcode[17] = 42;
  auto unknown_opcode = fbs::decode(bad_opcode);
  EXPECT_FALSE(unknown_opcode);
  EXPECT_TRUE(unknown_opcode.error().header);

  std::string body{};
  fbs::BookRequestPb book_pb{};
  book_pb.set_facility("Gym");
  book_pb.mutable_interval()->mutable_start()->set_day(7);
  book_pb.mutable_interval()->mutable_end()->set_day(0);
  EXPECT_TRUE(book_pb.SerializeToString(&body));
  EXPECT_FALSE(fbs::decode(frame(1, 2, body)));

  book_pb.clear_interval();
  EXPECT_TRUE(book_pb.SerializeToString(&body));
  EXPECT_FALSE(fbs::decode(frame(1, 2, body)));

  fbs::QueryRequestPb query_pb{};
  query_pb.add_days(1);
  EXPECT_TRUE(query_pb.SerializeToString(&body));
  auto empty_facility = fbs::decode(frame(1, 1, body));
  EXPECT_FALSE(empty_facility);
  EXPECT_TRUE(empty_facility.error().header);

  // an out of range query day is not malformed, the engine rejects it
  query_pb.set_facility("Gym");
  query_pb.add_days(9);
  EXPECT_TRUE(query_pb.SerializeToString(&body));
  EXPECT_TRUE(fbs::decode(frame(1, 1, body)));

  EXPECT_FALSE(fbs::decode(frame(1, 1, "\xff\xff\xff")));
  EXPECT_FALSE(fbs::decode(frame(2, 9, "")));
  EXPECT_FALSE(fbs::decode(frame(3, 1, "")));
  EXPECT_FALSE(fbs::decode(frame(1, 1, "", 5)));

  EXPECT_TRUE(fbs::isValidFacilityName("Room101"));
  EXPECT_FALSE(fbs::isValidFacilityName(""));
  EXPECT_FALSE(fbs::isValidFacilityName(std::string(256, 'a')));

  bool thrown{};
  try {
    fbs::encode(fbs::Fbs_Reply::error(kId, fbs::Fbs_Status::kInvalidRequest,
                                      std::string(70000, 'e')));
  } catch (const std::length_error &) {
    thrown = true;
  }

  EXPECT_TRUE(thrown);

  // whatever encodes fits in one UDP datagram
  size_t encoded{};
  size_t rejected{};
  for (size_t len = 65460; len <= 65520; ++len) {
    try {
      const auto bytes = fbs::encode(fbs::Fbs_Reply::error(
          kId, fbs::Fbs_Status::kInvalidRequest, std::string(len, 'e')));

      EXPECT_TRUE(bytes.size() <= fbs::kFbsMaxDatagramSize);
      ++encoded;
    } catch (const std::length_error &) {
      ++rejected;
    }
  }

  EXPECT_TRUE(encoded > 0);
  EXPECT_TRUE(rejected > 0);
  EXPECT_TRUE(fbs::kFbsMaxDatagramSize ==
              fbs::kFbsHeaderSize + fbs::kFbsMaxBodySize);
}

} // namespace

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  testHeader();
  testRequests();
  testReplies();
  testEvent();
  testMalformed();

  return RUN_ALL_TESTS();
}
