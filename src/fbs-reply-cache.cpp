/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-reply-cache.cpp
 * @brief Implementation of Fbs_Reply_Cache.
 */

#include "fbs-reply-cache.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace fbs {

Fbs_Reply_Cache::Fbs_Reply_Cache(std::chrono::milliseconds retention)
    : m_retention{retention} {}

auto Fbs_Reply_Cache::find(const Fbs_Request_Id &id) const
    -> std::optional<std::string> {
  std::lock_guard<std::mutex> lock(m_mutex);

  auto iter = m_entries.find(id);
  if (iter == m_entries.end() ||
      Clock::now() - iter->second.inserted >= m_retention) {
    return {};
  }

  return iter->second.encoded_reply;
}

void Fbs_Reply_Cache::insert(const Fbs_Request_Id &id,
                             std::string encoded_reply) {
  std::lock_guard<std::mutex> lock(m_mutex);

  m_entries.insert_or_assign(
      id, Fbs_Entry{std::move(encoded_reply), Clock::now()});
}

auto Fbs_Reply_Cache::purgeExpired() -> size_t {
  const auto now = Clock::now();

  std::lock_guard<std::mutex> lock(m_mutex);

  return std::erase_if(m_entries, [this, now](const auto &entry) {
    return now - entry.second.inserted >= m_retention;
  });
}

auto Fbs_Reply_Cache::size() const -> size_t {
  std::lock_guard<std::mutex> lock(m_mutex);

  return m_entries.size();
}

} // namespace fbs
