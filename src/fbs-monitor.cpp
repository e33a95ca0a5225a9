/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-monitor.cpp
 * @brief Implementation of Fbs_Monitor_Registry.
 */

#include "fbs-monitor.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <expected>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "fbs-codec.hpp"
#include "fbs-debug.hpp"
#include "fbs-util.hpp"

namespace fbs {

Fbs_Monitor_Registry::Fbs_Monitor_Registry(const Fbs_Facility_Store &store,
                                           Fbs_Io<Fbs_Datagram> &output,
                                           std::chrono::seconds max_duration)
    : m_store{store}, m_output{output}, m_max_duration{max_duration} {}

auto Fbs_Monitor_Registry::subscribe(std::string_view facility,
                                     const Fbs_Address &address,
                                     std::chrono::seconds duration)
    -> std::expected<Clock::time_point, Fbs_Status> {
  if (!m_store.hasFacility(facility)) {
    return std::unexpected(Fbs_Status::kFacilityNotFound);
  }

  if (duration.count() <= 0 || duration > m_max_duration) {
    return std::unexpected(Fbs_Status::kInvalidRequest);
  }

  const auto expiry = Clock::now() + duration;

  std::lock_guard<std::mutex> lock(m_mutex);

  auto &subscriptions = m_subscriptions[std::string{facility}];

  auto iter = std::find_if(subscriptions.begin(), subscriptions.end(),
                           [&address](const Fbs_Subscription &subscription) {
                             return subscription.address == address;
                           });
  if (iter != subscriptions.end()) {
    iter->expiry = expiry;
  } else {
    subscriptions.push_back(Fbs_Subscription{address, expiry});
  }

  FBS_DEBUG_PRINT(std::cerr << "monitor " << facility << " by "
                            << address.toString() << " for "
                            << duration.count() << "s\n");

  return expiry;
}

void Fbs_Monitor_Registry::onMutation(const Fbs_Mutation_Event &event) {
  std::lock_guard<std::mutex> lock(m_mutex);

  auto iter = m_subscriptions.find(event.facility);
  if (iter == m_subscriptions.end()) {
    return;
  }

  auto &subscriptions = iter->second;

  purgeExpiredLocked(subscriptions, Clock::now());
  if (subscriptions.empty()) {
    m_subscriptions.erase(iter);

    return;
  }

  m_event_seq = incrementByOne(m_event_seq);

  const std::string payload = encode(Fbs_Event{m_event_seq, event});

  for (const auto &subscription : subscriptions) {
    try {
      m_output.write(Fbs_Datagram{subscription.address, payload});
      ++m_push_count;

      FBS_DEBUG_PRINT(std::cerr << "push event " << m_event_seq << " to "
                                << subscription.address.toString() << ": "
                                << event.toString() << "\n");
    } catch (const std::exception &e) {
      FBS_DEBUG_PRINT(std::cerr << "push event to "
                                << subscription.address.toString()
                                << " failed: " << e.what() << "\n");
    }
  }
}

auto Fbs_Monitor_Registry::purgeExpired() -> size_t {
  size_t purged{};
  const auto now = Clock::now();

  std::lock_guard<std::mutex> lock(m_mutex);

  for (auto iter = m_subscriptions.begin(); iter != m_subscriptions.end();) {
    purged += purgeExpiredLocked(iter->second, now);

    if (iter->second.empty()) {
      iter = m_subscriptions.erase(iter);
    } else {
      ++iter;
    }
  }

  return purged;
}

auto Fbs_Monitor_Registry::getSubscriberCount(std::string_view facility) const
    -> size_t {
  const auto now = Clock::now();

  std::lock_guard<std::mutex> lock(m_mutex);

  auto iter = m_subscriptions.find(std::string{facility});
  if (iter == m_subscriptions.end()) {
    return 0;
  }

  return static_cast<size_t>(
      std::count_if(iter->second.begin(), iter->second.end(),
                    [now](const Fbs_Subscription &subscription) {
                      return now < subscription.expiry;
                    }));
}

auto Fbs_Monitor_Registry::getPushCount() const -> uint64_t {
  std::lock_guard<std::mutex> lock(m_mutex);

  return m_push_count;
}

auto Fbs_Monitor_Registry::purgeExpiredLocked(
    std::vector<Fbs_Subscription> &subscriptions, Clock::time_point now)
    -> size_t {
  const auto old_size = subscriptions.size();

  std::erase_if(subscriptions, [now](const Fbs_Subscription &subscription) {
    return !(now < subscription.expiry);
  });

  return old_size - subscriptions.size();
}

} // namespace fbs
