/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-reply-cache.hpp
 * @brief Fbs_Reply_Cache: encoded replies of non-idempotent requests, by
 *        request id, for a bounded time.
 *
 * The server looks a Book, Shift or Extend request up here before running
 * it. A hit means the request is a retransmission or a network duplicate of
 * one already executed, and the cached bytes are sent again unchanged, error
 * replies included. Entries older than the retention are ignored by find()
 * and removed by purgeExpired().
 *
 * All methods are thread-safe.
 */

#ifndef FBS_REPLY_CACHE_HPP_
#define FBS_REPLY_CACHE_HPP_

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "fbs-message.hpp"

namespace fbs {

class Fbs_Reply_Cache {
public:
  using Clock = std::chrono::steady_clock;

  explicit Fbs_Reply_Cache(std::chrono::milliseconds retention);
  virtual ~Fbs_Reply_Cache() noexcept = default;

  Fbs_Reply_Cache(const Fbs_Reply_Cache &obj) = delete;
  const Fbs_Reply_Cache &operator=(const Fbs_Reply_Cache &obj) = delete;
  Fbs_Reply_Cache(Fbs_Reply_Cache &&obj) = delete;
  Fbs_Reply_Cache &operator=(Fbs_Reply_Cache &&obj) = delete;

  auto find(const Fbs_Request_Id &id) const -> std::optional<std::string>;

  /**
   * @brief Remember @p encoded_reply for @p id, replacing an older entry.
   */
  void insert(const Fbs_Request_Id &id, std::string encoded_reply);

  /**
   * @return Number of entries removed.
   */
  auto purgeExpired() -> size_t;

  auto size() const -> size_t;

private:
  struct Fbs_Entry {
    std::string encoded_reply{};
    Clock::time_point inserted{};
  };

  const std::chrono::milliseconds m_retention{};

  mutable std::mutex m_mutex{};
  std::unordered_map<Fbs_Request_Id, Fbs_Entry, Fbs_Request_Id_Hash>
      m_entries{};
}; // class Fbs_Reply_Cache

} // namespace fbs

#endif // FBS_REPLY_CACHE_HPP_
