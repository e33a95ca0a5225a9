/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-client.cpp
 * @brief Implementation of Fbs_Client.
 */

#include "fbs-client.hpp"

#include <chrono>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "fbs-codec.hpp"
#include "fbs-debug.hpp"
#include "fbs-util.hpp"

namespace fbs {

namespace {

auto randomClientId() -> uint64_t {
  std::random_device random_device{};

  const uint64_t client_id = (static_cast<uint64_t>(random_device()) << 32) |
                             static_cast<uint64_t>(random_device());

  return client_id != 0 ? client_id : 1;
}

// a restarted client reusing its id must not hit the replies cached for
// its previous run, so numbering starts from the wall clock
auto initialSeq() -> uint64_t {
  const auto now = std::chrono::system_clock::now().time_since_epoch();

  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

} // namespace

Fbs_Client::Fbs_Client(const Fbs_Client_Config &config,
                       Fbs_Io<Fbs_Datagram> &input,
                       Fbs_Io<Fbs_Datagram> &output)
    : m_config{config}, m_input{input}, m_output{output},
      m_client_id{config.client_id ? *config.client_id : randomClientId()},
      m_seq{initialSeq()} {
  m_receive_proc = std::make_unique<Fbs_Proc>("client-receive", [this]() {
    while (true) {
      try {
        auto datagram = m_input.read();
        if (!datagram) {
          Fbs_Proc::yield();

          continue;
        }

        this->handleDatagram(*datagram);
      } catch (const std::exception &e) {
        FBS_DEBUG_PRINT(std::cerr << "client receive failed: " << e.what()
                                  << "\n");
      }

      Fbs_Proc::testcancel();
    }
  });

  m_receive_proc->exec();
}

Fbs_Client::~Fbs_Client() noexcept try {
  {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_stopping = true;
  }

  m_cond.notify_all();

  m_receive_proc.reset();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Fbs_Client::queryAvailability(std::string_view facility,
                                   const std::vector<uint32_t> &days)
    -> Result {
  return invoke(Fbs_Query_Request{std::string{facility}, days});
}

auto Fbs_Client::book(std::string_view facility, const Fbs_Interval &interval)
    -> Result {
  return invoke(Fbs_Book_Request{std::string{facility}, interval});
}

auto Fbs_Client::shift(uint64_t booking_id, int32_t offset_minutes)
    -> Result {
  return invoke(Fbs_Shift_Request{booking_id, offset_minutes});
}

auto Fbs_Client::getBooking(uint64_t booking_id) -> Result {
  return invoke(Fbs_Get_Booking_Request{booking_id});
}

auto Fbs_Client::extend(uint64_t booking_id, int32_t minutes) -> Result {
  return invoke(Fbs_Extend_Request{booking_id, minutes});
}

auto Fbs_Client::monitor(std::string_view facility,
                         std::chrono::seconds duration, Event_Handler handler)
    -> Result {
  std::lock_guard<std::mutex> call_lock(m_call_mutex);

  // installed before the request goes out, an event may beat the reply
  {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_event_handler = std::move(handler);
  }

  auto result = invokeLocked(Fbs_Monitor_Request{
      std::string{facility}, static_cast<uint32_t>(duration.count())});

  std::unique_lock<std::mutex> lock(m_mutex);

  if (result && result->status == Fbs_Status::kSuccess) {
    const auto deadline = std::chrono::steady_clock::now() + duration;

    FBS_DEBUG_PRINT(std::cerr << "monitoring " << facility << " for "
                              << duration.count() << "s\n");

    m_cond.wait_until(lock, deadline, [this]() { return m_stopping; });
  }

  m_event_handler = nullptr;

  // the handler may refer to the caller's frame
  m_cond.wait(lock, [this]() { return 0 == m_handlers_running; });

  return result;
}

auto Fbs_Client::invoke(Fbs_Request_Body body) -> Result {
  std::lock_guard<std::mutex> call_lock(m_call_mutex);

  return invokeLocked(std::move(body));
}

auto Fbs_Client::invokeLocked(Fbs_Request_Body body) -> Result {
  Fbs_Request request{};
  std::string payload{};

  {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_seq = incrementByOne(m_seq);
    request = Fbs_Request{Fbs_Request_Id{m_client_id, m_seq}, std::move(body)};
  }

  try {
    payload = encode(request);
  } catch (const std::exception &e) {
    return std::unexpected(Fbs_Invocation_Error{
        Fbs_Invocation_Error::Kind::kProtocol, e.what(), 0});
  }

  std::unique_lock<std::mutex> lock(m_mutex);

  m_pending = request.id;
  m_result.reset();

  const uint32_t max_attempts = m_config.retries + 1;
  uint32_t attempt{};

  while (attempt < max_attempts && !m_stopping) {
    ++attempt;

    lock.unlock();

    if (attempt > 1) {
      FBS_DEBUG_PRINT(std::cerr << "retransmit " << opcodeName(request.opcode())
                                << " seq " << request.id.seq << ", attempt "
                                << attempt << " of " << max_attempts << "\n");
    }

    try {
      m_output.write(Fbs_Datagram{m_config.server, payload});
    } catch (const std::exception &e) {
      FBS_DEBUG_PRINT(std::cerr << "send seq " << request.id.seq
                                << " failed: " << e.what() << "\n");
    }

    lock.lock();
    ++m_send_count;

    const auto deadline = std::chrono::steady_clock::now() + m_config.timeout;
    if (m_cond.wait_until(lock, deadline, [this]() {
          return m_result.has_value() || m_stopping;
        }) &&
        m_result) {
      auto result = std::move(*m_result);

      m_pending.reset();
      m_result.reset();

      if (!result) {
        return std::unexpected(Fbs_Invocation_Error{
            Fbs_Invocation_Error::Kind::kProtocol, result.error(), attempt});
      }

      return std::move(*result);
    }
  }

  m_pending.reset();
  m_result.reset();

  FBS_DEBUG_PRINT(std::cerr << "timeout " << opcodeName(request.opcode())
                            << " seq " << request.id.seq << " after "
                            << attempt << " attempts\n");

  return std::unexpected(Fbs_Invocation_Error{
      Fbs_Invocation_Error::Kind::kTimeout,
      "no reply after " + std::to_string(attempt) + " attempts", attempt});
}

void Fbs_Client::handleDatagram(const Fbs_Datagram &datagram) {
  auto message = decode(datagram.payload);
  if (!message) {
    const auto &header = message.error().header;

    std::lock_guard<std::mutex> lock(m_mutex);

    if (header && header->kind == Fbs_Message_Kind::kReply &&
        datagram.peer == m_config.server && m_pending &&
        !m_result &&
        *m_pending == Fbs_Request_Id{header->client_id, header->seq}) {
      m_result = std::unexpected("malformed reply: " + message.error().message);
      m_cond.notify_all();
    } else {
      FBS_DEBUG_PRINT(std::cerr << "drop datagram from "
                                << datagram.peer.toString() << ": "
                                << message.error().message << "\n");
    }

    return;
  }

  if (auto *reply = std::get_if<Fbs_Reply>(&*message)) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (datagram.peer != m_config.server) {
      FBS_DEBUG_PRINT(std::cerr << "discard reply seq " << reply->id.seq
                                << " from " << datagram.peer.toString()
                                << ", not the server\n");
    } else if (m_pending && !m_result && *m_pending == reply->id) {
      m_result = std::move(*reply);
      m_cond.notify_all();
    } else {
      FBS_DEBUG_PRINT(std::cerr << "discard stale reply seq " << reply->id.seq
                                << "\n");
    }

    return;
  }

  if (const auto *event = std::get_if<Fbs_Event>(&*message)) {
    Event_Handler handler{};

    {
      std::lock_guard<std::mutex> lock(m_mutex);

      handler = m_event_handler;
      if (handler) {
        ++m_handlers_running;
      }
    }

    if (!handler) {
      FBS_DEBUG_PRINT(std::cerr << "drop event " << event->seq
                                << ", not monitoring\n");

      return;
    }

    try {
      handler(*event);
    } catch (...) {
      this->handlerDone();

      throw;
    }

    this->handlerDone();

    return;
  }

  FBS_DEBUG_PRINT(std::cerr << "drop request datagram from "
                            << datagram.peer.toString() << "\n");
}

void Fbs_Client::handlerDone() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);

    --m_handlers_running;
  }

  m_cond.notify_all();
}

auto Fbs_Client::getClientId() const -> uint64_t { return m_client_id; }

auto Fbs_Client::getLastSeq() const -> uint64_t {
  std::lock_guard<std::mutex> lock(m_mutex);

  return m_seq;
}

auto Fbs_Client::getSendCount() const -> uint64_t {
  std::lock_guard<std::mutex> lock(m_mutex);

  return m_send_count;
}

} // namespace fbs
