/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-time.hpp
 * @brief Weekly time model: Fbs_Time_Point and Fbs_Interval.
 *
 * A booking calendar covers one recurring week and nothing else: no dates,
 * no time zones. A time point is (day, hour, minute) with day 0 = Monday and
 * maps one-to-one onto a minute-of-week in [0, kMinutesPerWeek). The week is
 * a flat line from Mon 00:00 to Sun 23:59; nothing wraps from Sunday into
 * Monday, so shifting an interval past either end makes it invalid rather
 * than moving it into the next or previous week.
 *
 * Intervals are half-open, [start, end): a booking ending at 10:00 does not
 * overlap one starting at 10:00.
 */

#ifndef FBS_TIME_HPP_
#define FBS_TIME_HPP_

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fbs {

constexpr int kDaysPerWeek = 7;
constexpr int kMinutesPerDay = 24 * 60;
constexpr int kMinutesPerWeek = kDaysPerWeek * kMinutesPerDay;

struct Fbs_Time_Point {
  uint32_t day{};
  uint32_t hour{};
  uint32_t minute{};

  auto operator<=>(const Fbs_Time_Point &other) const = default;

  auto isValid() const -> bool;

  /**
   * @brief Minutes elapsed since Mon 00:00.
   */
  auto toMinuteOfWeek() const -> int;

  /**
   * @return The time point, or std::nullopt when @p minute_of_week is
   *         outside [0, kMinutesPerWeek).
   */
  static auto fromMinuteOfWeek(int minute_of_week)
      -> std::optional<Fbs_Time_Point>;

  auto toString() const -> std::string;
};

struct Fbs_Interval {
  Fbs_Time_Point start{};
  Fbs_Time_Point end{};

  auto operator==(const Fbs_Interval &other) const -> bool = default;

  /**
   * @brief Both ends valid and start strictly before end.
   */
  auto isValid() const -> bool;

  auto overlaps(const Fbs_Interval &other) const -> bool;

  /**
   * @brief Whether the interval has at least one minute on @p day.
   */
  auto intersectsDay(uint32_t day) const -> bool;

  /**
   * @brief Move both ends by @p minutes.
   *
   * @return The moved interval, or std::nullopt if either end leaves the
   *         week.
   */
  auto shiftedBy(int minutes) const -> std::optional<Fbs_Interval>;

  /**
   * @brief Move the end by @p minutes, keeping the start.
   *
   * @return The new interval, or std::nullopt if the end leaves the week.
   */
  auto extendedBy(int minutes) const -> std::optional<Fbs_Interval>;

  auto toString() const -> std::string;
};

/**
 * @brief Three-letter English day name ("Mon" .. "Sun"), "???" if out of
 *        range.
 */
auto dayName(uint32_t day) -> std::string_view;

/**
 * @brief Parse a day name, case-insensitive, short ("tue") or long
 *        ("Tuesday") form.
 */
auto parseDay(std::string_view text) -> std::optional<uint32_t>;

/**
 * @brief Parse "Day HH:MM", e.g. "Mon 09:30".
 */
auto parseTimePoint(std::string_view text) -> std::optional<Fbs_Time_Point>;

/**
 * @brief Free stretches of @p day given the booked intervals of a facility.
 *
 * @p booked may hold intervals of any day in any order, only their part on
 * @p day counts. The end of the day is Fbs_Time_Point{day, 24, 0}, which
 * isValid() rejects but which prints as "24:00".
 */
auto freeSlots(uint32_t day, const std::vector<Fbs_Interval> &booked)
    -> std::vector<Fbs_Interval>;

auto operator<<(std::ostream &os, const Fbs_Time_Point &time_point)
    -> std::ostream &;
auto operator<<(std::ostream &os, const Fbs_Interval &interval)
    -> std::ostream &;

} // namespace fbs

#endif // FBS_TIME_HPP_
