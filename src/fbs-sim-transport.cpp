/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-sim-transport.cpp
 * @brief Implementation of Fbs_Sim_Transport.
 */

#include "fbs-sim-transport.hpp"

#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include "fbs-debug.hpp"

namespace fbs {

namespace {

void checkRate(double rate, const std::string &name) {
  if (!(rate >= 0.0 && rate <= 1.0)) {
    throw std::invalid_argument(name + " must be within [0, 1], got " +
                                std::to_string(rate));
  }
}

} // namespace

Fbs_Sim_Transport::Fbs_Sim_Transport(Fbs_Io<Fbs_Datagram> &inner,
                                     const Fbs_Sim_Config &config)
    : m_inner{inner}, m_config{config} {
  checkRate(m_config.p_drop, "drop probability");
  checkRate(m_config.p_duplicate, "duplicate probability");

  if (m_config.seed) {
    m_engine.seed(*m_config.seed);
  } else {
    m_engine.seed(std::random_device{}());
  }
}

auto Fbs_Sim_Transport::shouldDrop() -> bool {
  if (m_config.p_drop <= 0.0) {
    return false;
  }

  std::lock_guard<std::mutex> lock(m_mutex);

  return std::bernoulli_distribution{m_config.p_drop}(m_engine);
}

auto Fbs_Sim_Transport::copiesToSend() -> int {
  int copies{1};

  if (m_config.p_duplicate <= 0.0) {
    return copies;
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  std::bernoulli_distribution duplicate{m_config.p_duplicate};

  while (copies < kFbsMaxDuplicateCopies && duplicate(m_engine)) {
    ++copies;
  }

  return copies;
}

auto Fbs_Sim_Transport::read() -> std::optional<Fbs_Datagram> {
  while (true) {
    auto datagram = m_inner.read();
    if (!datagram) {
      return {};
    }

    if (m_config.drop_inbound && shouldDrop()) {
      ++m_dropped_inbound;

      FBS_DEBUG_PRINT(std::cerr << "sim: drop inbound datagram from "
                                << datagram->peer.toString() << "\n");
      continue;
    }

    return datagram;
  }
}

void Fbs_Sim_Transport::write(Fbs_Datagram &item) {
  if (shouldDrop()) {
    ++m_dropped;

    FBS_DEBUG_PRINT(std::cerr << "sim: drop datagram to "
                              << item.peer.toString() << "\n");
    return;
  }

  const int copies = copiesToSend();
  if (copies > 1) {
    m_duplicated += static_cast<uint64_t>(copies - 1);

    FBS_DEBUG_PRINT(std::cerr << "sim: send " << copies
                              << " copies of datagram to "
                              << item.peer.toString() << "\n");
  }

  for (int i = 0; i < copies; ++i) {
    m_inner.write(item);
    ++m_sent;
  }
}

void Fbs_Sim_Transport::write(Fbs_Datagram &&item) {
  Fbs_Datagram moved_item = std::move(item);

  write(moved_item);
}

auto Fbs_Sim_Transport::getStats() const -> Fbs_Sim_Stats {
  return Fbs_Sim_Stats{m_sent.load(), m_dropped.load(), m_duplicated.load(),
                       m_dropped_inbound.load()};
}

} // namespace fbs
