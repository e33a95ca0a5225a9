/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-client.hpp
 * @brief Fbs_Client: the client side of the request/reply protocol.
 *
 * Each call assigns the next sequence number, encodes the request once and
 * sends it. It then waits for the matching reply, at most the configured
 * timeout per attempt. Each time the wait runs out it resends the very same
 * bytes, up to the configured number of retries, and then gives up with a
 * timeout error. Giving up leaves nothing pending: the next call starts
 * afresh with a new sequence number.
 *
 * A receive thread reads the input endpoint. It completes the pending call
 * with the reply from the configured server carrying the pending request id
 * and discards any other reply (late answers to earlier calls, duplicates). Events are handed to
 * the callback of an ongoing monitor() call, or dropped when there is none.
 *
 * Calls are serialized: one call at a time per client object. monitor()
 * holds that exclusivity for the whole monitoring window after a successful
 * subscription, so no other call can start until the window has elapsed or
 * the client is destroyed.
 *
 * A reply with an error status is a successful invocation: it is returned as
 * an Fbs_Reply and its status tells what went wrong. Only a timeout, a reply
 * that could not be decoded, or a request that could not be encoded is an
 * Fbs_Invocation_Error.
 */

#ifndef FBS_CLIENT_HPP_
#define FBS_CLIENT_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fbs-config.hpp"
#include "fbs-io.hpp"
#include "fbs-message.hpp"
#include "fbs-proc.hpp"
#include "fbs-socket.hpp"
#include "fbs-time.hpp"

namespace fbs {

struct Fbs_Invocation_Error {
  enum class Kind {
    kTimeout,
    kProtocol,
  };

  Kind kind{Kind::kTimeout};
  std::string message{};
  uint32_t attempts{};
};

class Fbs_Client {
public:
  using Event_Handler = std::function<void(const Fbs_Event &)>;
  using Result = std::expected<Fbs_Reply, Fbs_Invocation_Error>;

  /**
   * @param config Timeout, retries, client id and server address.
   * @param input  Endpoint replies and events are read from.
   * @param output Endpoint requests are written to.
   *
   * Both endpoints must outlive the client; they may be the same object.
   */
  Fbs_Client(const Fbs_Client_Config &config, Fbs_Io<Fbs_Datagram> &input,
             Fbs_Io<Fbs_Datagram> &output);
  virtual ~Fbs_Client() noexcept;

  Fbs_Client(const Fbs_Client &obj) = delete;
  const Fbs_Client &operator=(const Fbs_Client &obj) = delete;
  Fbs_Client(Fbs_Client &&obj) = delete;
  Fbs_Client &operator=(Fbs_Client &&obj) = delete;

  auto queryAvailability(std::string_view facility,
                         const std::vector<uint32_t> &days) -> Result;
  auto book(std::string_view facility, const Fbs_Interval &interval)
      -> Result;
  auto shift(uint64_t booking_id, int32_t offset_minutes) -> Result;
  auto getBooking(uint64_t booking_id) -> Result;
  auto extend(uint64_t booking_id, int32_t minutes) -> Result;

  /**
   * @brief Subscribe to @p facility for @p duration and, if the server
   *        accepts, deliver every event to @p handler until the duration
   *        has elapsed. Returns after the window, or at once when the
   *        subscription failed.
   *
   * @p handler runs on the receive thread. monitor() does not return while
   * a call to it is still running.
   */
  auto monitor(std::string_view facility, std::chrono::seconds duration,
               Event_Handler handler) -> Result;

  /**
   * @brief Send any request body and wait for its reply.
   */
  auto invoke(Fbs_Request_Body body) -> Result;

  auto getClientId() const -> uint64_t;

  /**
   * @brief Sequence number used by the latest call. Before the first call
   *        it is the starting point, taken from the wall clock in
   *        microseconds, so two runs with the same client id do not reuse
   *        sequence numbers.
   */
  auto getLastSeq() const -> uint64_t;

  /**
   * @brief Number of datagrams sent, retransmissions included.
   */
  auto getSendCount() const -> uint64_t;

private:
  auto invokeLocked(Fbs_Request_Body body) -> Result;
  void handleDatagram(const Fbs_Datagram &datagram);
  void handlerDone();

  const Fbs_Client_Config m_config{};
  Fbs_Io<Fbs_Datagram> &m_input;
  Fbs_Io<Fbs_Datagram> &m_output;
  uint64_t m_client_id{};

  std::mutex m_call_mutex{};

  mutable std::mutex m_mutex{};
  std::condition_variable m_cond{};
  uint64_t m_seq{};
  uint64_t m_send_count{};
  std::optional<Fbs_Request_Id> m_pending{};
  std::optional<std::expected<Fbs_Reply, std::string>> m_result{};
  Event_Handler m_event_handler{};
  size_t m_handlers_running{};
  bool m_stopping{};

  std::unique_ptr<Fbs_Proc> m_receive_proc{};
}; // class Fbs_Client

} // namespace fbs

#endif // FBS_CLIENT_HPP_
