/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-monitor.hpp
 * @brief Fbs_Monitor_Registry: monitor subscriptions and event push.
 *
 * A client monitors a facility for a bounded number of seconds. While the
 * subscription is active every mutation of that facility is encoded once as
 * an Fbs_Event and written to the client's address through the output
 * endpoint, fire-and-forget: a lost event is not resent.
 *
 * Subscribing again from the same address to the same facility replaces the
 * expiry of the existing subscription instead of adding a second one.
 * A subscription is active while now < expiry. Expired subscriptions are
 * dropped lazily on each mutation of their facility and by purgeExpired(),
 * which the server runs from a timer.
 *
 * onMutation() is the Fbs_Facility_Store mutation listener. It is called
 * with the facility lock held and never calls back into the store.
 */

#ifndef FBS_MONITOR_HPP_
#define FBS_MONITOR_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "fbs-facility.hpp"
#include "fbs-io.hpp"
#include "fbs-message.hpp"
#include "fbs-socket.hpp"

namespace fbs {

class Fbs_Monitor_Registry {
public:
  using Clock = std::chrono::steady_clock;

  /**
   * @param store        Facilities that may be monitored.
   * @param output       Endpoint events are written to.
   * @param max_duration Longest accepted subscription.
   */
  Fbs_Monitor_Registry(const Fbs_Facility_Store &store,
                       Fbs_Io<Fbs_Datagram> &output,
                       std::chrono::seconds max_duration);
  virtual ~Fbs_Monitor_Registry() noexcept = default;

  Fbs_Monitor_Registry(const Fbs_Monitor_Registry &obj) = delete;
  const Fbs_Monitor_Registry &
  operator=(const Fbs_Monitor_Registry &obj) = delete;
  Fbs_Monitor_Registry(Fbs_Monitor_Registry &&obj) = delete;
  Fbs_Monitor_Registry &operator=(Fbs_Monitor_Registry &&obj) = delete;

  /**
   * @return The expiry of the (new or refreshed) subscription.
   */
  auto subscribe(std::string_view facility, const Fbs_Address &address,
                 std::chrono::seconds duration)
      -> std::expected<Clock::time_point, Fbs_Status>;

  void onMutation(const Fbs_Mutation_Event &event);

  /**
   * @return Number of subscriptions removed.
   */
  auto purgeExpired() -> size_t;

  /**
   * @brief Number of active subscriptions on @p facility.
   */
  auto getSubscriberCount(std::string_view facility) const -> size_t;

  /**
   * @brief Number of event datagrams written so far.
   */
  auto getPushCount() const -> uint64_t;

private:
  struct Fbs_Subscription {
    Fbs_Address address{};
    Clock::time_point expiry{};
  };

  static auto purgeExpiredLocked(std::vector<Fbs_Subscription> &subscriptions,
                                 Clock::time_point now) -> size_t;

  const Fbs_Facility_Store &m_store;
  Fbs_Io<Fbs_Datagram> &m_output;
  const std::chrono::seconds m_max_duration{};

  mutable std::mutex m_mutex{};
  std::unordered_map<std::string, std::vector<Fbs_Subscription>>
      m_subscriptions{};
  uint64_t m_event_seq{};
  uint64_t m_push_count{};
}; // class Fbs_Monitor_Registry

} // namespace fbs

#endif // FBS_MONITOR_HPP_
