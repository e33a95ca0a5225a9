/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file include/fbs-util.hpp
 * @brief Small header-only helpers shared by the codec, client and server.
 *
 *  - incrementByOne<T>(T): next value of a counter that never yields 0, used
 *    for request sequence numbers and event counters (0 means "none").
 *  - stringCompare(...): equality with optional ASCII case folding, used when
 *    parsing day names and command-line flags.
 *  - toHex()/fromHex(): fixed-width lowercase hex of a 64-bit value, the
 *    printable form of booking and client ids.
 */

#ifndef FBS_UTIL_HPP_
#define FBS_UTIL_HPP_

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fbs {

/**
 * @brief Return max(1, value + 1). Unsigned overflow wraps to 1, never 0.
 */
template <typename T> inline T incrementByOne(T value) {
  return std::max<T>(1, value + 1);
}

inline bool stringCompare(const std::string_view str1,
                          const std::string_view str2,
                          bool caseInsensitive = true) {
  if (str1.size() != str2.size()) {
    return false;
  }

  return std::equal(str1.begin(), str1.end(), str2.begin(),
                    [caseInsensitive](char c1, char c2) {
                      if (caseInsensitive) {
                        return std::tolower(static_cast<unsigned char>(c1)) ==
                               std::tolower(static_cast<unsigned char>(c2));
                      }

                      return c1 == c2;
                    });
}

inline std::string toHex(uint64_t value) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex(16, '0');

  for (int i = 15; i >= 0; --i) {
    hex[i] = kDigits[value & 0xf];
    value >>= 4;
  }

  return hex;
}

/**
 * @brief Parse 1 to 16 hex digits (either case).
 *
 * @return The value, or std::nullopt on an empty, too long or non-hex text.
 */
inline std::optional<uint64_t> fromHex(std::string_view text) {
  uint64_t value{};

  if (text.empty() || text.size() > 16) {
    return {};
  }

  for (const char c : text) {
    const int digit = std::isdigit(static_cast<unsigned char>(c))
                          ? c - '0'
                          : std::tolower(static_cast<unsigned char>(c)) - 'a' +
                                10;
    if (digit < 0 || digit > 15) {
      return {};
    }

    value = (value << 4) | static_cast<uint64_t>(digit);
  }

  return value;
}

} // namespace fbs

#endif // FBS_UTIL_HPP_
