/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-time.cpp
 * @brief Implementation of the weekly time model.
 */

#include "fbs-time.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdio>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fbs-util.hpp"

namespace fbs {

namespace {

constexpr std::array<std::string_view, kDaysPerWeek> kShortDayNames{
    "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

constexpr std::array<std::string_view, kDaysPerWeek> kLongDayNames{
    "Monday", "Tuesday",  "Wednesday", "Thursday",
    "Friday", "Saturday", "Sunday"};

auto parseNumber(std::string_view text) -> std::optional<uint32_t> {
  uint32_t value{};

  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return {};
  }

  return value;
}

} // namespace

auto Fbs_Time_Point::isValid() const -> bool {
  return day < kDaysPerWeek && hour < 24 && minute < 60;
}

auto Fbs_Time_Point::toMinuteOfWeek() const -> int {
  return static_cast<int>(day) * kMinutesPerDay + static_cast<int>(hour) * 60 +
         static_cast<int>(minute);
}

auto Fbs_Time_Point::fromMinuteOfWeek(int minute_of_week)
    -> std::optional<Fbs_Time_Point> {
  if (minute_of_week < 0 || minute_of_week >= kMinutesPerWeek) {
    return {};
  }

  const int minute_of_day = minute_of_week % kMinutesPerDay;

  return Fbs_Time_Point{static_cast<uint32_t>(minute_of_week / kMinutesPerDay),
                        static_cast<uint32_t>(minute_of_day / 60),
                        static_cast<uint32_t>(minute_of_day % 60)};
}

auto Fbs_Time_Point::toString() const -> std::string {
  char buf[16]{};

  std::snprintf(buf, sizeof(buf), " %02u:%02u", hour, minute);

  return std::string{dayName(day)} + buf;
}

auto Fbs_Interval::isValid() const -> bool {
  return start.isValid() && end.isValid() && start < end;
}

auto Fbs_Interval::overlaps(const Fbs_Interval &other) const -> bool {
  return start < other.end && other.start < end;
}

auto Fbs_Interval::intersectsDay(uint32_t day) const -> bool {
  const Fbs_Interval whole_day{Fbs_Time_Point{day, 0, 0},
                               day + 1 < kDaysPerWeek
                                   ? Fbs_Time_Point{day + 1, 0, 0}
                                   : Fbs_Time_Point{day, 24, 0}};

  return overlaps(whole_day);
}

auto Fbs_Interval::shiftedBy(int minutes) const
    -> std::optional<Fbs_Interval> {
  auto new_start = Fbs_Time_Point::fromMinuteOfWeek(start.toMinuteOfWeek() +
                                                    minutes);
  auto new_end =
      Fbs_Time_Point::fromMinuteOfWeek(end.toMinuteOfWeek() + minutes);
  if (!new_start || !new_end) {
    return {};
  }

  return Fbs_Interval{*new_start, *new_end};
}

auto Fbs_Interval::extendedBy(int minutes) const
    -> std::optional<Fbs_Interval> {
  auto new_end =
      Fbs_Time_Point::fromMinuteOfWeek(end.toMinuteOfWeek() + minutes);
  if (!new_end) {
    return {};
  }

  return Fbs_Interval{start, *new_end};
}

auto Fbs_Interval::toString() const -> std::string {
  return start.toString() + " - " + end.toString();
}

auto dayName(uint32_t day) -> std::string_view {
  if (day >= kDaysPerWeek) {
    return "???";
  }

  return kShortDayNames[day];
}

auto parseDay(std::string_view text) -> std::optional<uint32_t> {
  for (uint32_t day = 0; day < kDaysPerWeek; ++day) {
    if (stringCompare(text, kShortDayNames[day]) ||
        stringCompare(text, kLongDayNames[day])) {
      return day;
    }
  }

  return {};
}

auto parseTimePoint(std::string_view text) -> std::optional<Fbs_Time_Point> {
  const auto space = text.find(' ');
  if (space == std::string_view::npos) {
    return {};
  }

  const auto colon = text.find(':', space);
  if (colon == std::string_view::npos) {
    return {};
  }

  auto day = parseDay(text.substr(0, space));
  auto hour = parseNumber(text.substr(space + 1, colon - space - 1));
  auto minute = parseNumber(text.substr(colon + 1));
  if (!day || !hour || !minute) {
    return {};
  }

  Fbs_Time_Point time_point{*day, *hour, *minute};
  if (!time_point.isValid()) {
    return {};
  }

  return time_point;
}

auto freeSlots(uint32_t day, const std::vector<Fbs_Interval> &booked)
    -> std::vector<Fbs_Interval> {
  std::vector<std::pair<int, int>> busy{};
  std::vector<Fbs_Interval> slots{};

  if (day >= kDaysPerWeek) {
    return slots;
  }

  const int day_start = static_cast<int>(day) * kMinutesPerDay;
  const int day_end = day_start + kMinutesPerDay;

  for (const auto &interval : booked) {
    const int start = std::max(interval.start.toMinuteOfWeek(), day_start);
    const int end = std::min(interval.end.toMinuteOfWeek(), day_end);
    if (start < end) {
      busy.emplace_back(start, end);
    }
  }

  std::sort(busy.begin(), busy.end());

  const auto toTimePoint = [day, day_end](int minute) -> Fbs_Time_Point {
    if (minute == day_end) {
      return Fbs_Time_Point{day, 24, 0};
    }

    return *Fbs_Time_Point::fromMinuteOfWeek(minute);
  };

  int current = day_start;
  for (const auto &[start, end] : busy) {
    if (current < start) {
      slots.push_back(Fbs_Interval{toTimePoint(current), toTimePoint(start)});
    }

    current = std::max(current, end);
  }

  if (current < day_end) {
    slots.push_back(Fbs_Interval{toTimePoint(current), toTimePoint(day_end)});
  }

  return slots;
}

auto operator<<(std::ostream &os, const Fbs_Time_Point &time_point)
    -> std::ostream & {
  return os << time_point.toString();
}

auto operator<<(std::ostream &os, const Fbs_Interval &interval)
    -> std::ostream & {
  return os << interval.toString();
}

} // namespace fbs
