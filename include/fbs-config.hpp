/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-config.hpp
 * @brief Configuration of fbs-server and fbs-client, and its command-line
 *        parsing.
 *
 * Both executables take "--key=value" arguments. Boolean keys may be given
 * bare ("--drop-inbound") or with a value of true/false/1/0. Parsing returns
 * std::unexpected(message) for an unknown key, a missing or malformed value,
 * or a value out of range; it never throws.
 *
 * Server keys:
 *   --port=N                UDP port to listen on
 *   --drop=P                probability of losing a datagram, [0, 1]
 *   --duplicate=P           probability of each extra copy, [0, 1]
 *   --drop-inbound          apply --drop to received datagrams as well
 *   --no-reply-cache        execute every duplicate (at-least-once)
 *   --cache-retention-ms=N  lifetime of a cached reply
 *   --workers=N             number of request workers
 *   --facility=NAME         facility to create, repeatable
 *   --max-monitor-sec=N     longest accepted monitor duration
 *   --seed=N                seed for loss simulation and booking ids
 *
 * Client keys:
 *   --server=IP:PORT        server address
 *   --port=N                local UDP port, 0 for an ephemeral one
 *   --timeout-ms=N          wait for a reply before retransmitting
 *   --retries=N             retransmissions before giving up
 *   --drop, --duplicate, --drop-inbound, --seed as for the server
 *   --client-id=HEX         client id, random when not given
 */

#ifndef FBS_CONFIG_HPP_
#define FBS_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "fbs-sim-transport.hpp"
#include "fbs-socket.hpp"

#define FBS_DEFAULT_PORT (34524)
#define FBS_DEFAULT_SERVER_IP4 "127.0.0.1"
#define FBS_DEFAULT_CACHE_RETENTION_MS (30000)
#define FBS_DEFAULT_WORKERS (4)
#define FBS_DEFAULT_MAX_MONITOR_SEC (3600)
#define FBS_DEFAULT_TIMEOUT_MS (1000)
#define FBS_DEFAULT_RETRIES (4)
#define FBS_DEFAULT_FACILITIES {"Room101", "Room102", "LectureTheatre", "Gym"}

namespace fbs {

struct Fbs_Server_Config {
  int port{FBS_DEFAULT_PORT};
  Fbs_Sim_Config sim{};
  bool use_reply_cache{true};
  std::chrono::milliseconds cache_retention{FBS_DEFAULT_CACHE_RETENTION_MS};
  size_t workers{FBS_DEFAULT_WORKERS};
  std::vector<std::string> facilities FBS_DEFAULT_FACILITIES;
  std::chrono::seconds max_monitor{FBS_DEFAULT_MAX_MONITOR_SEC};
  std::optional<uint64_t> seed{};
};

struct Fbs_Client_Config {
  Fbs_Address server{FBS_DEFAULT_SERVER_IP4, FBS_DEFAULT_PORT};
  int port{};
  std::chrono::milliseconds timeout{FBS_DEFAULT_TIMEOUT_MS};
  uint32_t retries{FBS_DEFAULT_RETRIES};
  Fbs_Sim_Config sim{};
  std::optional<uint64_t> client_id{};
};

/**
 * @param argc, argv As passed to main(), argv[0] is skipped.
 */
auto parseServerConfig(int argc, const char *const argv[])
    -> std::expected<Fbs_Server_Config, std::string>;

auto parseClientConfig(int argc, const char *const argv[])
    -> std::expected<Fbs_Client_Config, std::string>;

auto serverUsage() -> std::string;
auto clientUsage() -> std::string;

} // namespace fbs

#endif // FBS_CONFIG_HPP_
