/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-sim-transport.hpp
 * @brief Fbs_Sim_Transport: an Fbs_Io<Fbs_Datagram> decorator that loses and
 *        duplicates datagrams on purpose.
 *
 * The wrapper sits between the service and its real endpoint (a Fbs_Socket,
 * or a Fbs_Pipe in tests) and exercises the retry and duplicate-suppression
 * logic above it:
 *
 *  - write(): the datagram is dropped with probability p_drop; otherwise it
 *    is handed to the inner endpoint 1 + Geometric(p_duplicate) times, at
 *    most kFbsMaxDuplicateCopies times in total.
 *  - read(): with drop_inbound set, each datagram read from the inner
 *    endpoint is discarded with probability p_drop and the next one is read
 *    instead.
 *
 * Payload bytes are never altered and datagrams are never reordered, the
 * copies of one datagram are written back to back. All random draws come
 * from one generator, seeded from the configuration when a seed is given so
 * that tests are reproducible.
 *
 * write() and read() may be called concurrently from several threads.
 */

#ifndef FBS_SIM_TRANSPORT_HPP_
#define FBS_SIM_TRANSPORT_HPP_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

#include "fbs-io.hpp"
#include "fbs-socket.hpp"

namespace fbs {

constexpr int kFbsMaxDuplicateCopies = 8;

struct Fbs_Sim_Config {
  double p_drop{};
  double p_duplicate{};
  bool drop_inbound{};
  std::optional<uint64_t> seed{};
};

struct Fbs_Sim_Stats {
  uint64_t sent{};
  uint64_t dropped{};
  uint64_t duplicated{};
  uint64_t dropped_inbound{};
};

class Fbs_Sim_Transport : public Fbs_Io<Fbs_Datagram> {
public:
  /**
   * @param inner  Endpoint doing the real I/O, must outlive this object.
   * @param config Loss and duplication rates.
   *
   * @throws std::invalid_argument if a rate is outside [0, 1].
   */
  Fbs_Sim_Transport(Fbs_Io<Fbs_Datagram> &inner, const Fbs_Sim_Config &config);
  virtual ~Fbs_Sim_Transport() noexcept = default;

  Fbs_Sim_Transport(const Fbs_Sim_Transport &obj) = delete;
  const Fbs_Sim_Transport &operator=(const Fbs_Sim_Transport &obj) = delete;
  Fbs_Sim_Transport(Fbs_Sim_Transport &&obj) = delete;
  Fbs_Sim_Transport &operator=(Fbs_Sim_Transport &&obj) = delete;

  auto read() -> std::optional<Fbs_Datagram> override;

  void write(Fbs_Datagram &item) override;
  void write(Fbs_Datagram &&item) override;

  auto getStats() const -> Fbs_Sim_Stats;

private:
  auto shouldDrop() -> bool;

  /**
   * @brief Number of times the next datagram goes out, 1 or more.
   */
  auto copiesToSend() -> int;

  Fbs_Io<Fbs_Datagram> &m_inner;
  const Fbs_Sim_Config m_config{};

  std::mutex m_mutex{};
  std::mt19937_64 m_engine{};

  std::atomic<uint64_t> m_sent{};
  std::atomic<uint64_t> m_dropped{};
  std::atomic<uint64_t> m_duplicated{};
  std::atomic<uint64_t> m_dropped_inbound{};
}; // class Fbs_Sim_Transport

} // namespace fbs

#endif // FBS_SIM_TRANSPORT_HPP_
