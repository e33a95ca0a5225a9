/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-server.hpp
 * @brief Fbs_Server: the server side of the request/reply protocol.
 *
 * The server reads datagrams from its input endpoint on a dedicated thread
 * and hands each one to one of a fixed pool of Fbs_Async workers, chosen by
 * the client id in the datagram header. All datagrams of one client are
 * therefore handled in arrival order by one thread, and a duplicate can not
 * overtake the original it duplicates.
 *
 * A worker decodes the datagram and:
 *  - drops it with a debug line if the header is unreadable or it is not a
 *    request;
 *  - answers MalformedRequest, echoing the request id, if only the body is
 *    bad;
 *  - for Book, Shift and Extend with the reply cache enabled, resends the
 *    cached reply bytes of an already executed request id without running
 *    the operation again (at-most-once);
 *  - otherwise runs the operation against the Fbs_Facility_Store or the
 *    Fbs_Monitor_Registry, encodes the reply, caches it when the operation
 *    is not idempotent, and writes it back to the sender.
 *
 * With the reply cache disabled every copy of a request is executed
 * (at-least-once), which is what the --no-reply-cache switch demonstrates.
 *
 * A timer purges expired reply cache entries and monitor subscriptions.
 *
 * The server owns everything it uses except its two endpoints, which must
 * outlive it. Input and output may be the same object.
 */

#ifndef FBS_SERVER_HPP_
#define FBS_SERVER_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "fbs-async.hpp"
#include "fbs-config.hpp"
#include "fbs-facility.hpp"
#include "fbs-io.hpp"
#include "fbs-message.hpp"
#include "fbs-monitor.hpp"
#include "fbs-proc.hpp"
#include "fbs-reply-cache.hpp"
#include "fbs-socket.hpp"
#include "fbs-timer.hpp"

namespace fbs {

struct Fbs_Server_Stats {
  uint64_t received{};
  uint64_t executed{};
  uint64_t replayed{};
  uint64_t malformed{};
};

class Fbs_Server {
public:
  /**
   * @throws std::invalid_argument if the configuration has no worker or an
   *         invalid facility name.
   */
  Fbs_Server(const Fbs_Server_Config &config, Fbs_Io<Fbs_Datagram> &input,
             Fbs_Io<Fbs_Datagram> &output);
  virtual ~Fbs_Server() noexcept;

  Fbs_Server(const Fbs_Server &obj) = delete;
  const Fbs_Server &operator=(const Fbs_Server &obj) = delete;
  Fbs_Server(Fbs_Server &&obj) = delete;
  Fbs_Server &operator=(Fbs_Server &&obj) = delete;

  /**
   * @brief Queue @p datagram to its worker, as the input thread does for
   *        every datagram it reads.
   */
  void submit(Fbs_Datagram datagram);

  /**
   * @brief Block until every datagram submitted so far has been handled.
   */
  void waitForIdle();

  /**
   * @brief Run one request and build its reply, bypassing the reply cache.
   *
   * @param peer Sender of the request, the address monitor events go to.
   */
  auto execute(const Fbs_Request &request, const Fbs_Address &peer)
      -> Fbs_Reply;

  auto getStore() -> Fbs_Facility_Store &;
  auto getRegistry() -> Fbs_Monitor_Registry &;
  auto getReplyCache() -> Fbs_Reply_Cache &;
  auto getStats() const -> Fbs_Server_Stats;

private:
  void handleDatagram(const Fbs_Datagram &datagram);
  void reply(const Fbs_Address &peer, std::string payload);
  void purge();

  const Fbs_Server_Config m_config{};
  Fbs_Io<Fbs_Datagram> &m_input;
  Fbs_Io<Fbs_Datagram> &m_output;

  Fbs_Facility_Store m_store;
  Fbs_Monitor_Registry m_registry;
  Fbs_Reply_Cache m_reply_cache;

  std::atomic<uint64_t> m_received{};
  std::atomic<uint64_t> m_executed{};
  std::atomic<uint64_t> m_replayed{};
  std::atomic<uint64_t> m_malformed{};

  std::vector<std::unique_ptr<Fbs_Async>> m_workers{};
  std::unique_ptr<Fbs_Timer<std::chrono::milliseconds>> m_purge_timer{};
  std::unique_ptr<Fbs_Proc> m_input_proc{};
}; // class Fbs_Server

} // namespace fbs

#endif // FBS_SERVER_HPP_
