/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-server.cpp
 * @brief Implementation of Fbs_Server.
 */

#include "fbs-server.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "fbs-codec.hpp"
#include "fbs-debug.hpp"
#include "fbs-util.hpp"

namespace fbs {

namespace {

auto describeFailure(Fbs_Status status, const std::string &subject)
    -> std::string {
  switch (status) {
  case Fbs_Status::kFacilityNotFound:
    return "facility '" + subject + "' does not exist";
  case Fbs_Status::kBookingNotFound:
    return "booking " + subject + " does not exist";
  case Fbs_Status::kInvalidInterval:
    return "interval is empty or outside the week";
  case Fbs_Status::kOverlap:
    return "interval overlaps an existing booking";
  case Fbs_Status::kInvalidRequest:
    return "invalid request parameters";
  case Fbs_Status::kMalformedRequest:
    return "malformed request";
  case Fbs_Status::kSuccess:
    break;
  }

  return std::string{statusName(status)};
}

auto purgePeriod(std::chrono::milliseconds retention)
    -> std::chrono::milliseconds {
  return std::clamp(retention / 2, std::chrono::milliseconds{50},
                    std::chrono::milliseconds{1000});
}

} // namespace

Fbs_Server::Fbs_Server(const Fbs_Server_Config &config,
                       Fbs_Io<Fbs_Datagram> &input,
                       Fbs_Io<Fbs_Datagram> &output)
    : m_config{config}, m_input{input}, m_output{output},
      m_store{config.facilities, config.seed},
      m_registry{m_store, output, config.max_monitor},
      m_reply_cache{config.cache_retention} {
  if (0 == m_config.workers) {
    throw std::invalid_argument("Fbs_Server needs at least one worker");
  }

  m_store.setMutationListener([this](const Fbs_Mutation_Event &event) {
    m_registry.onMutation(event);
  });

  for (size_t i = 0; i < m_config.workers; ++i) {
    m_workers.push_back(
        std::make_unique<Fbs_Async>("worker-" + std::to_string(i)));
  }

  m_purge_timer = std::make_unique<Fbs_Timer<std::chrono::milliseconds>>(
      purgePeriod(m_config.cache_retention), [this]() { this->purge(); });

  m_input_proc = std::make_unique<Fbs_Proc>("server-input", [this]() {
    while (true) {
      try {
        auto datagram = m_input.read();
        if (!datagram) {
          Fbs_Proc::yield();

          continue;
        }

        this->submit(std::move(*datagram));
      } catch (const std::exception &e) {
        FBS_DEBUG_PRINT(std::cerr << "server input failed: " << e.what()
                                  << "\n");
      }

      Fbs_Proc::testcancel();
    }
  });

  m_input_proc->exec();
}

Fbs_Server::~Fbs_Server() noexcept try {
  m_input_proc.reset();
  m_purge_timer.reset();
  m_workers.clear();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

void Fbs_Server::submit(Fbs_Datagram datagram) {
  ++m_received;

  auto header = decodeHeader(datagram.payload);
  if (!header) {
    ++m_malformed;

    FBS_DEBUG_PRINT(std::cerr << "drop datagram from "
                              << datagram.peer.toString() << ": "
                              << header.error() << "\n");
    return;
  }

  auto &worker = m_workers[header->client_id % m_workers.size()];

  worker->addExecTask([this, datagram = std::move(datagram)]() {
    this->handleDatagram(datagram);
  });
}

void Fbs_Server::waitForIdle() {
  for (auto &worker : m_workers) {
    worker->waitForEmpty();
  }
}

void Fbs_Server::handleDatagram(const Fbs_Datagram &datagram) {
  auto message = decode(datagram.payload);
  if (!message) {
    ++m_malformed;

    const auto &header = message.error().header;
    if (header && header->kind == Fbs_Message_Kind::kRequest) {
      FBS_DEBUG_PRINT(std::cerr << "malformed request " << header->seq
                                << " from " << datagram.peer.toString()
                                << ": " << message.error().message << "\n");

      reply(datagram.peer,
            encode(Fbs_Reply::error(
                Fbs_Request_Id{header->client_id, header->seq},
                Fbs_Status::kMalformedRequest, message.error().message)));
    } else {
      FBS_DEBUG_PRINT(std::cerr << "drop datagram from "
                                << datagram.peer.toString() << ": "
                                << message.error().message << "\n");
    }

    return;
  }

  const auto *request = std::get_if<Fbs_Request>(&*message);
  if (nullptr == request) {
    FBS_DEBUG_PRINT(std::cerr << "drop non-request datagram from "
                              << datagram.peer.toString() << "\n");
    return;
  }

  const bool cacheable =
      m_config.use_reply_cache && !isIdempotent(request->opcode());

  if (cacheable) {
    auto cached = m_reply_cache.find(request->id);
    if (cached) {
      ++m_replayed;

      FBS_DEBUG_PRINT(std::cerr << "replay cached reply to "
                                << opcodeName(request->opcode()) << " "
                                << toHex(request->id.client_id) << "/"
                                << request->id.seq << "\n");

      reply(datagram.peer, std::move(*cached));

      return;
    }
  }

  auto encoded = encode(execute(*request, datagram.peer));

  if (cacheable) {
    m_reply_cache.insert(request->id, encoded);
  }

  reply(datagram.peer, std::move(encoded));
}

auto Fbs_Server::execute(const Fbs_Request &request, const Fbs_Address &peer)
    -> Fbs_Reply {
  ++m_executed;

  FBS_DEBUG_PRINT(std::cerr << "execute " << opcodeName(request.opcode())
                            << " " << toHex(request.id.client_id) << "/"
                            << request.id.seq << " from " << peer.toString()
                            << "\n");

  return std::visit(
      [this, &request, &peer](const auto &body) -> Fbs_Reply {
        using T = std::decay_t<decltype(body)>;

        if constexpr (std::is_same_v<T, Fbs_Query_Request>) {
          auto days = m_store.queryAvailability(body.facility, body.days);
          if (!days) {
            return Fbs_Reply::error(request.id, days.error(),
                                    describeFailure(days.error(),
                                                    body.facility));
          }

          return Fbs_Reply{request.id, Fbs_Status::kSuccess,
                           Fbs_Query_Reply{std::move(*days)}};
        } else if constexpr (std::is_same_v<T, Fbs_Book_Request>) {
          auto booking_id = m_store.book(body.facility, body.interval,
                                         request.id.client_id);
          if (!booking_id) {
            return Fbs_Reply::error(request.id, booking_id.error(),
                                    describeFailure(booking_id.error(),
                                                    body.facility));
          }

          return Fbs_Reply{request.id, Fbs_Status::kSuccess,
                           Fbs_Book_Reply{*booking_id}};
        } else if constexpr (std::is_same_v<T, Fbs_Shift_Request>) {
          auto interval = m_store.shift(body.booking_id, body.offset_minutes);
          if (!interval) {
            return Fbs_Reply::error(request.id, interval.error(),
                                    describeFailure(interval.error(),
                                                    toHex(body.booking_id)));
          }

          return Fbs_Reply{request.id, Fbs_Status::kSuccess,
                           Fbs_Interval_Reply{*interval}};
        } else if constexpr (std::is_same_v<T, Fbs_Monitor_Request>) {
          auto expiry = m_registry.subscribe(
              body.facility, peer, std::chrono::seconds{body.duration_sec});
          if (!expiry) {
            return Fbs_Reply::error(request.id, expiry.error(),
                                    describeFailure(expiry.error(),
                                                    body.facility));
          }

          return Fbs_Reply{request.id, Fbs_Status::kSuccess,
                           Fbs_Monitor_Reply{body.duration_sec}};
        } else if constexpr (std::is_same_v<T, Fbs_Get_Booking_Request>) {
          auto record = m_store.getBooking(body.booking_id);
          if (!record) {
            return Fbs_Reply::error(request.id, record.error(),
                                    describeFailure(record.error(),
                                                    toHex(body.booking_id)));
          }

          return Fbs_Reply{request.id, Fbs_Status::kSuccess,
                           std::move(*record)};
        } else {
          static_assert(std::is_same_v<T, Fbs_Extend_Request>);

          auto interval = m_store.extend(body.booking_id, body.minutes);
          if (!interval) {
            return Fbs_Reply::error(request.id, interval.error(),
                                    describeFailure(interval.error(),
                                                    toHex(body.booking_id)));
          }

          return Fbs_Reply{request.id, Fbs_Status::kSuccess,
                           Fbs_Interval_Reply{*interval}};
        }
      },
      request.body);
}

void Fbs_Server::reply(const Fbs_Address &peer, std::string payload) {
  m_output.write(Fbs_Datagram{peer, std::move(payload)});
}

void Fbs_Server::purge() {
  const auto replies = m_reply_cache.purgeExpired();
  const auto subscriptions = m_registry.purgeExpired();

  if (replies > 0 || subscriptions > 0) {
    FBS_DEBUG_PRINT(std::cerr << "purged " << replies << " cached replies and "
                              << subscriptions << " subscriptions\n");
  }
}

auto Fbs_Server::getStore() -> Fbs_Facility_Store & { return m_store; }

auto Fbs_Server::getRegistry() -> Fbs_Monitor_Registry & {
  return m_registry;
}

auto Fbs_Server::getReplyCache() -> Fbs_Reply_Cache & { return m_reply_cache; }

auto Fbs_Server::getStats() const -> Fbs_Server_Stats {
  return Fbs_Server_Stats{m_received.load(), m_executed.load(),
                          m_replayed.load(), m_malformed.load()};
}

} // namespace fbs
