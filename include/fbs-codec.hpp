/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-codec.hpp
 * @brief Wire codec: Fbs_Request, Fbs_Reply and Fbs_Event to and from bytes.
 *
 * Every datagram starts with a 20-byte header, all integers big-endian:
 *
 *   offset  size  field
 *   0       1     kind (1 request, 2 reply, 3 event)
 *   1       8     client id
 *   9       8     sequence number
 *   17      1     code: opcode (request), status (reply), 0 (event)
 *   18      2     body length
 *
 * followed by exactly body-length bytes of a protobuf message from
 * proto/fbs-wire.proto. A reply echoes the (client id, sequence number) of
 * its request. An event carries client id 0 and the sender's event counter.
 *
 * decode() never throws on bad input. It rejects truncated datagrams,
 * length mismatches, unknown kinds, opcodes and statuses, unparsable bodies,
 * missing fields and out of range values. When the header was readable it is
 * returned with the error, so the server can still answer a malformed
 * request with a MalformedRequest reply carrying the request id.
 */

#ifndef FBS_CODEC_HPP_
#define FBS_CODEC_HPP_

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "fbs-message.hpp"
#include "fbs-socket.hpp"

namespace fbs {

constexpr size_t kFbsHeaderSize = 20;
constexpr size_t kFbsMaxBodySize = kFbsMaxDatagramSize - kFbsHeaderSize;
constexpr size_t kFbsMaxFacilityNameSize = 255;

struct Fbs_Header {
  Fbs_Message_Kind kind{Fbs_Message_Kind::kRequest};
  uint64_t client_id{};
  uint64_t seq{};
  uint8_t code{};
  uint16_t body_len{};
};

using Fbs_Message = std::variant<Fbs_Request, Fbs_Reply, Fbs_Event>;

struct Fbs_Decode_Error {
  std::string message{};
  std::optional<Fbs_Header> header{};
};

/**
 * @throws std::length_error if the serialized body exceeds kFbsMaxBodySize.
 */
auto encode(const Fbs_Request &request) -> std::string;
auto encode(const Fbs_Reply &reply) -> std::string;
auto encode(const Fbs_Event &event) -> std::string;

/**
 * @brief Decode only the 20-byte header, without looking at the body.
 */
auto decodeHeader(std::string_view bytes)
    -> std::expected<Fbs_Header, std::string>;

auto decode(std::string_view bytes)
    -> std::expected<Fbs_Message, Fbs_Decode_Error>;

/**
 * @brief Whether @p name is acceptable as a facility name on the wire.
 */
auto isValidFacilityName(std::string_view name) -> bool;

} // namespace fbs

#endif // FBS_CODEC_HPP_
