/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-message.hpp
 * @brief In-memory form of the requests, replies and monitor events.
 *
 * Every message on the wire is one of three kinds:
 *  - Fbs_Request: sent by a client, identified by (client id, sequence
 *    number), the pair every retransmission of the same call repeats;
 *  - Fbs_Reply: sent by the server, echoing the request id, with a status
 *    and an operation specific body (or an error text);
 *  - Fbs_Event: pushed by the server to monitoring clients when a facility
 *    changes.
 *
 * The request and reply bodies are closed sets held in std::variant so that
 * dispatching on them with std::visit is checked for exhaustiveness at
 * compile time.
 */

#ifndef FBS_MESSAGE_HPP_
#define FBS_MESSAGE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "fbs-time.hpp"

namespace fbs {

enum class Fbs_Message_Kind : uint8_t {
  kRequest = 1,
  kReply = 2,
  kEvent = 3,
};

enum class Fbs_Opcode : uint8_t {
  kQueryAvailability = 1,
  kBook = 2,
  kShift = 3,
  kMonitor = 4,
  kGetBooking = 5,
  kExtend = 6,
};

enum class Fbs_Status : uint8_t {
  kSuccess = 0,
  kMalformedRequest = 1,
  kFacilityNotFound = 2,
  kBookingNotFound = 3,
  kInvalidInterval = 4,
  kOverlap = 5,
  kInvalidRequest = 6,
};

enum class Fbs_Mutation_Kind : uint8_t {
  kBooked = 1,
  kShifted = 2,
  kExtended = 3,
};

auto opcodeName(Fbs_Opcode opcode) -> std::string_view;
auto statusName(Fbs_Status status) -> std::string_view;
auto mutationKindName(Fbs_Mutation_Kind kind) -> std::string_view;

/**
 * @brief Whether executing the operation twice has the same effect as
 *        executing it once. Replies to the others are cached by the server.
 */
auto isIdempotent(Fbs_Opcode opcode) -> bool;

struct Fbs_Request_Id {
  uint64_t client_id{};
  uint64_t seq{};

  auto operator==(const Fbs_Request_Id &other) const -> bool = default;
};

struct Fbs_Request_Id_Hash {
  auto operator()(const Fbs_Request_Id &id) const -> size_t {
    return static_cast<size_t>(id.client_id * 0x9e3779b97f4a7c15ULL ^ id.seq);
  }
};

// request bodies

struct Fbs_Query_Request {
  std::string facility{};
  std::vector<uint32_t> days{};
};

struct Fbs_Book_Request {
  std::string facility{};
  Fbs_Interval interval{};
};

struct Fbs_Shift_Request {
  uint64_t booking_id{};
  int32_t offset_minutes{};
};

struct Fbs_Monitor_Request {
  std::string facility{};
  uint32_t duration_sec{};
};

struct Fbs_Get_Booking_Request {
  uint64_t booking_id{};
};

struct Fbs_Extend_Request {
  uint64_t booking_id{};
  int32_t minutes{};
};

using Fbs_Request_Body =
    std::variant<Fbs_Query_Request, Fbs_Book_Request, Fbs_Shift_Request,
                 Fbs_Monitor_Request, Fbs_Get_Booking_Request,
                 Fbs_Extend_Request>;

struct Fbs_Request {
  Fbs_Request_Id id{};
  Fbs_Request_Body body{};

  auto opcode() const -> Fbs_Opcode;
};

// reply bodies

struct Fbs_Day_Bookings {
  uint32_t day{};
  std::vector<Fbs_Interval> intervals{};

  auto operator==(const Fbs_Day_Bookings &other) const -> bool = default;
};

struct Fbs_Query_Reply {
  std::vector<Fbs_Day_Bookings> days{};
};

struct Fbs_Book_Reply {
  uint64_t booking_id{};
};

/**
 * Reply of shift and extend: the interval now held by the booking.
 */
struct Fbs_Interval_Reply {
  Fbs_Interval interval{};
};

struct Fbs_Monitor_Reply {
  uint32_t duration_sec{};
};

struct Fbs_Booking_Record {
  uint64_t booking_id{};
  std::string facility{};
  Fbs_Interval interval{};
  uint64_t client_id{};

  auto operator==(const Fbs_Booking_Record &other) const -> bool = default;
};

struct Fbs_Error_Reply {
  std::string message{};
};

using Fbs_Reply_Body =
    std::variant<Fbs_Query_Reply, Fbs_Book_Reply, Fbs_Interval_Reply,
                 Fbs_Monitor_Reply, Fbs_Booking_Record, Fbs_Error_Reply>;

struct Fbs_Reply {
  Fbs_Request_Id id{};
  Fbs_Status status{Fbs_Status::kSuccess};
  Fbs_Reply_Body body{};

  /**
   * @brief Build an error reply for request @p id.
   */
  static auto error(const Fbs_Request_Id &id, Fbs_Status status,
                    std::string message) -> Fbs_Reply;

  /**
   * @brief The error text of an error reply, empty otherwise.
   */
  auto errorMessage() const -> std::string_view;
};

// monitor events

/**
 * A change applied to a facility, as observed by its monitors.
 */
struct Fbs_Mutation_Event {
  std::string facility{};
  Fbs_Mutation_Kind kind{Fbs_Mutation_Kind::kBooked};
  uint64_t booking_id{};
  Fbs_Interval interval{};
  std::optional<Fbs_Interval> previous{};

  auto operator==(const Fbs_Mutation_Event &other) const -> bool = default;

  auto toString() const -> std::string;
};

struct Fbs_Event {
  uint64_t seq{};
  Fbs_Mutation_Event mutation{};
};

} // namespace fbs

#endif // FBS_MESSAGE_HPP_
