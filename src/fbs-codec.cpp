/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-codec.cpp
 * @brief Implementation of the wire codec.
 *
 * The header is packed and unpacked by hand, the body goes through the
 * protobuf messages generated from proto/fbs-wire.proto. Conversion from a
 * protobuf message back to the in-memory type is where field presence and
 * value ranges are checked.
 */

#include "fbs-codec.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "fbs-message.hpp"
#include "fbs-time.hpp"
#include "proto/fbs-wire.pb.h"

namespace fbs {

namespace {

void putUint(std::string &out, uint64_t value, size_t size) {
  for (size_t i = size; i > 0; --i) {
    out.push_back(static_cast<char>((value >> ((i - 1) * 8)) & 0xff));
  }
}

auto getUint(std::string_view in, size_t offset, size_t size) -> uint64_t {
  uint64_t value{};

  for (size_t i = 0; i < size; ++i) {
    value = (value << 8) | static_cast<uint8_t>(in[offset + i]);
  }

  return value;
}

auto frame(Fbs_Message_Kind kind, const Fbs_Request_Id &id, uint8_t code,
           const google::protobuf::Message &body) -> std::string {
  std::string serialized{};

  if (!body.SerializeToString(&serialized)) {
    throw std::runtime_error("Error serializing message body");
  }

  if (serialized.size() > kFbsMaxBodySize) {
    throw std::length_error("Message body of " +
                            std::to_string(serialized.size()) +
                            " bytes exceeds the datagram limit");
  }

  std::string out{};
  out.reserve(kFbsHeaderSize + serialized.size());

  putUint(out, static_cast<uint8_t>(kind), 1);
  putUint(out, id.client_id, 8);
  putUint(out, id.seq, 8);
  putUint(out, code, 1);
  putUint(out, serialized.size(), 2);
  out += serialized;

  return out;
}

void toPb(const Fbs_Time_Point &time_point, TimePointPb *pb) {
  pb->set_day(time_point.day);
  pb->set_hour(time_point.hour);
  pb->set_minute(time_point.minute);
}

void toPb(const Fbs_Interval &interval, IntervalPb *pb) {
  toPb(interval.start, pb->mutable_start());
  toPb(interval.end, pb->mutable_end());
}

auto fromPb(const TimePointPb &pb) -> std::optional<Fbs_Time_Point> {
  Fbs_Time_Point time_point{pb.day(), pb.hour(), pb.minute()};
  if (!time_point.isValid()) {
    return {};
  }

  return time_point;
}

/**
 * Both ends present and in range; start before end is not required here,
 * an inverted interval is a domain error reported by the booking engine.
 */
auto fromPb(const IntervalPb &pb) -> std::optional<Fbs_Interval> {
  if (!pb.has_start() || !pb.has_end()) {
    return {};
  }

  auto start = fromPb(pb.start());
  auto end = fromPb(pb.end());
  if (!start || !end) {
    return {};
  }

  return Fbs_Interval{*start, *end};
}

template <typename Pb> auto parseBody(std::string_view body, Pb &pb) -> bool {
  return pb.ParseFromArray(body.data(), static_cast<int>(body.size()));
}

auto decodeRequest(const Fbs_Header &header, std::string_view body)
    -> std::expected<Fbs_Request_Body, std::string> {
  switch (static_cast<Fbs_Opcode>(header.code)) {
  case Fbs_Opcode::kQueryAvailability: {
    QueryRequestPb pb{};
    if (!parseBody(body, pb)) {
      break;
    }

    if (!isValidFacilityName(pb.facility())) {
      return std::unexpected("invalid facility name");
    }

    return Fbs_Query_Request{pb.facility(),
                             {pb.days().begin(), pb.days().end()}};
  }

  case Fbs_Opcode::kBook: {
    BookRequestPb pb{};
    if (!parseBody(body, pb)) {
      break;
    }

    if (!isValidFacilityName(pb.facility())) {
      return std::unexpected("invalid facility name");
    }

    auto interval = pb.has_interval() ? fromPb(pb.interval()) : std::nullopt;
    if (!interval) {
      return std::unexpected("missing or out of range interval");
    }

    return Fbs_Book_Request{pb.facility(), *interval};
  }

  case Fbs_Opcode::kShift: {
    ShiftRequestPb pb{};
    if (!parseBody(body, pb)) {
      break;
    }

    return Fbs_Shift_Request{pb.booking_id(), pb.offset_minutes()};
  }

  case Fbs_Opcode::kMonitor: {
    MonitorRequestPb pb{};
    if (!parseBody(body, pb)) {
      break;
    }

    if (!isValidFacilityName(pb.facility())) {
      return std::unexpected("invalid facility name");
    }

    return Fbs_Monitor_Request{pb.facility(), pb.duration_sec()};
  }

  case Fbs_Opcode::kGetBooking: {
    GetBookingRequestPb pb{};
    if (!parseBody(body, pb)) {
      break;
    }

    return Fbs_Get_Booking_Request{pb.booking_id()};
  }

  case Fbs_Opcode::kExtend: {
    ExtendRequestPb pb{};
    if (!parseBody(body, pb)) {
      break;
    }

    return Fbs_Extend_Request{pb.booking_id(), pb.minutes()};
  }

  default:
    return std::unexpected("unknown opcode " + std::to_string(header.code));
  }

  return std::unexpected("unparsable request body");
}

auto decodeReply(const Fbs_Header &header, std::string_view body)
    -> std::expected<Fbs_Reply, std::string> {
  ReplyBodyPb pb{};
  Fbs_Reply reply{};

  if (header.code > static_cast<uint8_t>(Fbs_Status::kInvalidRequest)) {
    return std::unexpected("unknown status " + std::to_string(header.code));
  }

  if (!parseBody(body, pb)) {
    return std::unexpected("unparsable reply body");
  }

  reply.id = Fbs_Request_Id{header.client_id, header.seq};
  reply.status = static_cast<Fbs_Status>(header.code);

  switch (pb.body_case()) {
  case ReplyBodyPb::kQuery: {
    Fbs_Query_Reply query{};

    for (const auto &day_pb : pb.query().days()) {
      Fbs_Day_Bookings day{day_pb.day(), {}};
      if (day.day >= kDaysPerWeek) {
        return std::unexpected("day out of range");
      }

      for (const auto &interval_pb : day_pb.intervals()) {
        auto interval = fromPb(interval_pb);
        if (!interval) {
          return std::unexpected("missing or out of range interval");
        }

        day.intervals.push_back(*interval);
      }

      query.days.push_back(std::move(day));
    }

    reply.body = std::move(query);
    break;
  }

  case ReplyBodyPb::kBook:
    reply.body = Fbs_Book_Reply{pb.book().booking_id()};
    break;

  case ReplyBodyPb::kInterval: {
    auto interval = pb.interval().has_interval()
                        ? fromPb(pb.interval().interval())
                        : std::nullopt;
    if (!interval) {
      return std::unexpected("missing or out of range interval");
    }

    reply.body = Fbs_Interval_Reply{*interval};
    break;
  }

  case ReplyBodyPb::kMonitor:
    reply.body = Fbs_Monitor_Reply{pb.monitor().duration_sec()};
    break;

  case ReplyBodyPb::kBooking: {
    const auto &booking = pb.booking();
    auto interval =
        booking.has_interval() ? fromPb(booking.interval()) : std::nullopt;
    if (!interval || !isValidFacilityName(booking.facility())) {
      return std::unexpected("invalid booking record");
    }

    reply.body = Fbs_Booking_Record{booking.booking_id(), booking.facility(),
                                    *interval, booking.client_id()};
    break;
  }

  case ReplyBodyPb::kError:
    reply.body = Fbs_Error_Reply{pb.error().message()};
    break;

  case ReplyBodyPb::BODY_NOT_SET:
    return std::unexpected("reply without body");
  }

  return reply;
}

auto decodeEvent(const Fbs_Header &header, std::string_view body)
    -> std::expected<Fbs_Event, std::string> {
  EventPb pb{};
  Fbs_Event event{};

  if (header.code != 0) {
    return std::unexpected("event with non-zero code");
  }

  if (!parseBody(body, pb)) {
    return std::unexpected("unparsable event body");
  }

  if (!isValidFacilityName(pb.facility())) {
    return std::unexpected("invalid facility name");
  }

  if (pb.kind() != BOOKED && pb.kind() != SHIFTED && pb.kind() != EXTENDED) {
    return std::unexpected("unknown mutation kind");
  }

  auto interval = pb.has_interval() ? fromPb(pb.interval()) : std::nullopt;
  if (!interval) {
    return std::unexpected("missing or out of range interval");
  }

  event.seq = header.seq;
  event.mutation.facility = pb.facility();
  event.mutation.kind = static_cast<Fbs_Mutation_Kind>(pb.kind());
  event.mutation.booking_id = pb.booking_id();
  event.mutation.interval = *interval;

  if (pb.has_previous()) {
    auto previous = fromPb(pb.previous());
    if (!previous) {
      return std::unexpected("out of range previous interval");
    }

    event.mutation.previous = *previous;
  }

  return event;
}

} // namespace

auto isValidFacilityName(std::string_view name) -> bool {
  return !name.empty() && name.size() <= kFbsMaxFacilityNameSize;
}

auto encode(const Fbs_Request &request) -> std::string {
  return std::visit(
      [&request](const auto &body) -> std::string {
        using T = std::decay_t<decltype(body)>;

        const auto code = static_cast<uint8_t>(request.opcode());

        if constexpr (std::is_same_v<T, Fbs_Query_Request>) {
          QueryRequestPb pb{};
          pb.set_facility(body.facility);
          for (const auto day : body.days) {
            pb.add_days(day);
          }

          return frame(Fbs_Message_Kind::kRequest, request.id, code, pb);
        } else if constexpr (std::is_same_v<T, Fbs_Book_Request>) {
          BookRequestPb pb{};
          pb.set_facility(body.facility);
          toPb(body.interval, pb.mutable_interval());

          return frame(Fbs_Message_Kind::kRequest, request.id, code, pb);
        } else if constexpr (std::is_same_v<T, Fbs_Shift_Request>) {
          ShiftRequestPb pb{};
          pb.set_booking_id(body.booking_id);
          pb.set_offset_minutes(body.offset_minutes);

          return frame(Fbs_Message_Kind::kRequest, request.id, code, pb);
        } else if constexpr (std::is_same_v<T, Fbs_Monitor_Request>) {
          MonitorRequestPb pb{};
          pb.set_facility(body.facility);
          pb.set_duration_sec(body.duration_sec);

          return frame(Fbs_Message_Kind::kRequest, request.id, code, pb);
        } else if constexpr (std::is_same_v<T, Fbs_Get_Booking_Request>) {
          GetBookingRequestPb pb{};
          pb.set_booking_id(body.booking_id);

          return frame(Fbs_Message_Kind::kRequest, request.id, code, pb);
        } else {
          static_assert(std::is_same_v<T, Fbs_Extend_Request>);

          ExtendRequestPb pb{};
          pb.set_booking_id(body.booking_id);
          pb.set_minutes(body.minutes);

          return frame(Fbs_Message_Kind::kRequest, request.id, code, pb);
        }
      },
      request.body);
}

auto encode(const Fbs_Reply &reply) -> std::string {
  ReplyBodyPb pb{};

  std::visit(
      [&pb](const auto &body) {
        using T = std::decay_t<decltype(body)>;

        if constexpr (std::is_same_v<T, Fbs_Query_Reply>) {
          auto *query = pb.mutable_query();
          for (const auto &day : body.days) {
            auto *day_pb = query->add_days();
            day_pb->set_day(day.day);
            for (const auto &interval : day.intervals) {
              toPb(interval, day_pb->add_intervals());
            }
          }
        } else if constexpr (std::is_same_v<T, Fbs_Book_Reply>) {
          pb.mutable_book()->set_booking_id(body.booking_id);
        } else if constexpr (std::is_same_v<T, Fbs_Interval_Reply>) {
          toPb(body.interval, pb.mutable_interval()->mutable_interval());
        } else if constexpr (std::is_same_v<T, Fbs_Monitor_Reply>) {
          pb.mutable_monitor()->set_duration_sec(body.duration_sec);
        } else if constexpr (std::is_same_v<T, Fbs_Booking_Record>) {
          auto *booking = pb.mutable_booking();
          booking->set_booking_id(body.booking_id);
          booking->set_facility(body.facility);
          toPb(body.interval, booking->mutable_interval());
          booking->set_client_id(body.client_id);
        } else {
          static_assert(std::is_same_v<T, Fbs_Error_Reply>);

          pb.mutable_error()->set_message(body.message);
        }
      },
      reply.body);

  return frame(Fbs_Message_Kind::kReply, reply.id,
               static_cast<uint8_t>(reply.status), pb);
}

auto encode(const Fbs_Event &event) -> std::string {
  EventPb pb{};
  const auto &mutation = event.mutation;

  pb.set_facility(mutation.facility);
  pb.set_kind(static_cast<MutationKindPb>(mutation.kind));
  pb.set_booking_id(mutation.booking_id);
  toPb(mutation.interval, pb.mutable_interval());
  if (mutation.previous) {
    toPb(*mutation.previous, pb.mutable_previous());
  }

  return frame(Fbs_Message_Kind::kEvent, Fbs_Request_Id{0, event.seq}, 0, pb);
}

auto decodeHeader(std::string_view bytes)
    -> std::expected<Fbs_Header, std::string> {
  Fbs_Header header{};

  if (bytes.size() < kFbsHeaderSize) {
    return std::unexpected("truncated header: " + std::to_string(bytes.size()) +
                           " bytes");
  }

  const auto kind = static_cast<uint8_t>(bytes[0]);
  if (kind < static_cast<uint8_t>(Fbs_Message_Kind::kRequest) ||
      kind > static_cast<uint8_t>(Fbs_Message_Kind::kEvent)) {
    return std::unexpected("unknown message kind " + std::to_string(kind));
  }

  header.kind = static_cast<Fbs_Message_Kind>(kind);
  header.client_id = getUint(bytes, 1, 8);
  header.seq = getUint(bytes, 9, 8);
  header.code = static_cast<uint8_t>(getUint(bytes, 17, 1));
  header.body_len = static_cast<uint16_t>(getUint(bytes, 18, 2));

  return header;
}

auto decode(std::string_view bytes)
    -> std::expected<Fbs_Message, Fbs_Decode_Error> {
  auto header = decodeHeader(bytes);
  if (!header) {
    return std::unexpected(Fbs_Decode_Error{header.error(), std::nullopt});
  }

  if (bytes.size() - kFbsHeaderSize != header->body_len) {
    return std::unexpected(Fbs_Decode_Error{
        "body length " + std::to_string(header->body_len) + " but " +
            std::to_string(bytes.size() - kFbsHeaderSize) + " bytes follow",
        *header});
  }

  const auto body = bytes.substr(kFbsHeaderSize);

  switch (header->kind) {
  case Fbs_Message_Kind::kRequest: {
    auto request_body = decodeRequest(*header, body);
    if (!request_body) {
      return std::unexpected(Fbs_Decode_Error{request_body.error(), *header});
    }

    return Fbs_Request{Fbs_Request_Id{header->client_id, header->seq},
                       std::move(*request_body)};
  }

  case Fbs_Message_Kind::kReply: {
    auto reply = decodeReply(*header, body);
    if (!reply) {
      return std::unexpected(Fbs_Decode_Error{reply.error(), *header});
    }

    return std::move(*reply);
  }

  case Fbs_Message_Kind::kEvent: {
    auto event = decodeEvent(*header, body);
    if (!event) {
      return std::unexpected(Fbs_Decode_Error{event.error(), *header});
    }

    return std::move(*event);
  }
  }

  return std::unexpected(Fbs_Decode_Error{"unknown message kind", *header});
}

} // namespace fbs
