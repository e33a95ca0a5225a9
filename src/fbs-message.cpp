/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-message.cpp
 * @brief Names and helpers of the message types.
 */

#include "fbs-message.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "fbs-util.hpp"

namespace fbs {

auto opcodeName(Fbs_Opcode opcode) -> std::string_view {
  switch (opcode) {
  case Fbs_Opcode::kQueryAvailability:
    return "QueryAvailability";
  case Fbs_Opcode::kBook:
    return "Book";
  case Fbs_Opcode::kShift:
    return "Shift";
  case Fbs_Opcode::kMonitor:
    return "Monitor";
  case Fbs_Opcode::kGetBooking:
    return "GetBooking";
  case Fbs_Opcode::kExtend:
    return "Extend";
  }

  return "Unknown";
}

auto statusName(Fbs_Status status) -> std::string_view {
  switch (status) {
  case Fbs_Status::kSuccess:
    return "Success";
  case Fbs_Status::kMalformedRequest:
    return "MalformedRequest";
  case Fbs_Status::kFacilityNotFound:
    return "FacilityNotFound";
  case Fbs_Status::kBookingNotFound:
    return "BookingNotFound";
  case Fbs_Status::kInvalidInterval:
    return "InvalidInterval";
  case Fbs_Status::kOverlap:
    return "Overlap";
  case Fbs_Status::kInvalidRequest:
    return "InvalidRequest";
  }

  return "Unknown";
}

auto mutationKindName(Fbs_Mutation_Kind kind) -> std::string_view {
  switch (kind) {
  case Fbs_Mutation_Kind::kBooked:
    return "Booked";
  case Fbs_Mutation_Kind::kShifted:
    return "Shifted";
  case Fbs_Mutation_Kind::kExtended:
    return "Extended";
  }

  return "Unknown";
}

auto isIdempotent(Fbs_Opcode opcode) -> bool {
  switch (opcode) {
  case Fbs_Opcode::kQueryAvailability:
  case Fbs_Opcode::kMonitor:
  case Fbs_Opcode::kGetBooking:
    return true;

  case Fbs_Opcode::kBook:
  case Fbs_Opcode::kShift:
  case Fbs_Opcode::kExtend:
    return false;
  }

  return false;
}

auto Fbs_Request::opcode() const -> Fbs_Opcode {
  // variant alternatives are declared in opcode order
  return static_cast<Fbs_Opcode>(body.index() + 1);
}

auto Fbs_Reply::error(const Fbs_Request_Id &id, Fbs_Status status,
                      std::string message) -> Fbs_Reply {
  return Fbs_Reply{id, status, Fbs_Error_Reply{std::move(message)}};
}

auto Fbs_Reply::errorMessage() const -> std::string_view {
  if (const auto *err = std::get_if<Fbs_Error_Reply>(&body)) {
    return err->message;
  }

  return {};
}

auto Fbs_Mutation_Event::toString() const -> std::string {
  std::string text = std::string{mutationKindName(kind)} + " " + facility +
                     " booking " + toHex(booking_id) + ": " +
                     interval.toString();
  if (previous) {
    text += " (was " + previous->toString() + ")";
  }

  return text;
}

} // namespace fbs
