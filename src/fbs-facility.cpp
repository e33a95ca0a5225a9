/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-facility.cpp
 * @brief Implementation of Fbs_Facility_Store.
 *
 * Overlap checks are a linear scan of the facility's sorted bookings. A
 * moved booking is taken out and inserted again at its new sorted position.
 */

#include "fbs-facility.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
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
#include <vector>

#include "fbs-codec.hpp"
#include "fbs-debug.hpp"
#include "fbs-util.hpp"

namespace fbs {

Fbs_Facility_Store::Fbs_Facility_Store(const std::vector<std::string> &names,
                                       std::optional<uint64_t> id_seed) {
  for (const auto &name : names) {
    if (!isValidFacilityName(name)) {
      throw std::invalid_argument("Invalid facility name: '" + name + "'");
    }

    if (m_facilities.contains(name)) {
      continue;
    }

    auto facility = std::make_unique<Fbs_Facility>();
    facility->name = name;

    m_facilities.emplace(name, std::move(facility));
  }

  if (id_seed) {
    m_last_id = *id_seed;
  } else {
    std::random_device random_device{};

    m_last_id = (static_cast<uint64_t>(random_device()) << 32) |
                static_cast<uint64_t>(random_device());
  }
}

void Fbs_Facility_Store::setMutationListener(Mutation_Listener listener) {
  m_listener = std::move(listener);
}

auto Fbs_Facility_Store::hasFacility(std::string_view name) const -> bool {
  return nullptr != findFacility(name);
}

auto Fbs_Facility_Store::getFacilityNames() const -> std::vector<std::string> {
  std::vector<std::string> names{};

  for (const auto &[name, facility] : m_facilities) {
    names.push_back(name);
  }

  std::sort(names.begin(), names.end());

  return names;
}

auto Fbs_Facility_Store::queryAvailability(
    std::string_view name, const std::vector<uint32_t> &days) const
    -> std::expected<std::vector<Fbs_Day_Bookings>, Fbs_Status> {
  std::vector<Fbs_Day_Bookings> result{};

  const auto *facility = findFacility(name);
  if (nullptr == facility) {
    return std::unexpected(Fbs_Status::kFacilityNotFound);
  }

  if (days.empty() ||
      std::any_of(days.begin(), days.end(),
                  [](uint32_t day) { return day >= kDaysPerWeek; })) {
    return std::unexpected(Fbs_Status::kInvalidRequest);
  }

  std::vector<uint32_t> sorted_days{days};
  std::sort(sorted_days.begin(), sorted_days.end());
  sorted_days.erase(std::unique(sorted_days.begin(), sorted_days.end()),
                    sorted_days.end());

  std::lock_guard<std::mutex> lock(facility->mutex);

  for (const auto day : sorted_days) {
    Fbs_Day_Bookings day_bookings{day, {}};

    for (const auto &booking : facility->bookings) {
      if (booking.interval.intersectsDay(day)) {
        day_bookings.intervals.push_back(booking.interval);
      }
    }

    result.push_back(std::move(day_bookings));
  }

  return result;
}

auto Fbs_Facility_Store::book(std::string_view name,
                              const Fbs_Interval &interval, uint64_t client_id)
    -> std::expected<uint64_t, Fbs_Status> {
  auto *facility = findFacility(name);
  if (nullptr == facility) {
    return std::unexpected(Fbs_Status::kFacilityNotFound);
  }

  if (!interval.isValid()) {
    return std::unexpected(Fbs_Status::kInvalidInterval);
  }

  std::lock_guard<std::mutex> lock(facility->mutex);

  if (overlapsAny(*facility, interval)) {
    return std::unexpected(Fbs_Status::kOverlap);
  }

  uint64_t booking_id{};
  {
    std::lock_guard<std::mutex> index_lock(m_index_mutex);

    do {
      m_last_id = incrementByOne(m_last_id);
    } while (m_booking_index.contains(m_last_id));

    booking_id = m_last_id;
    m_booking_index.emplace(booking_id, facility);
  }

  insertSorted(*facility, Fbs_Booking{booking_id, interval, client_id});

  FBS_DEBUG_PRINT(std::cerr << "booked " << toHex(booking_id) << " on "
                            << facility->name << ": " << interval << "\n");

  notify(Fbs_Mutation_Event{facility->name, Fbs_Mutation_Kind::kBooked,
                            booking_id, interval, std::nullopt});

  return booking_id;
}

auto Fbs_Facility_Store::shift(uint64_t booking_id, int32_t offset)
    -> std::expected<Fbs_Interval, Fbs_Status> {
  return moveBooking(booking_id, offset, Fbs_Mutation_Kind::kShifted,
                     [offset](const Fbs_Interval &current) {
                       return current.shiftedBy(offset);
                     });
}

auto Fbs_Facility_Store::extend(uint64_t booking_id, int32_t minutes)
    -> std::expected<Fbs_Interval, Fbs_Status> {
  return moveBooking(booking_id, minutes, Fbs_Mutation_Kind::kExtended,
                     [minutes](const Fbs_Interval &current) {
                       return current.extendedBy(minutes);
                     });
}

auto Fbs_Facility_Store::getBooking(uint64_t booking_id) const
    -> std::expected<Fbs_Booking_Record, Fbs_Status> {
  const auto *facility = findFacilityOfBooking(booking_id);
  if (nullptr == facility) {
    return std::unexpected(Fbs_Status::kBookingNotFound);
  }

  std::lock_guard<std::mutex> lock(facility->mutex);

  for (const auto &booking : facility->bookings) {
    if (booking.id == booking_id) {
      return Fbs_Booking_Record{booking.id, facility->name, booking.interval,
                                booking.client_id};
    }
  }

  return std::unexpected(Fbs_Status::kBookingNotFound);
}

auto Fbs_Facility_Store::getBookings(std::string_view name) const
    -> std::expected<std::vector<Fbs_Booking_Record>, Fbs_Status> {
  std::vector<Fbs_Booking_Record> records{};

  const auto *facility = findFacility(name);
  if (nullptr == facility) {
    return std::unexpected(Fbs_Status::kFacilityNotFound);
  }

  std::lock_guard<std::mutex> lock(facility->mutex);

  for (const auto &booking : facility->bookings) {
    records.push_back(Fbs_Booking_Record{booking.id, facility->name,
                                         booking.interval, booking.client_id});
  }

  return records;
}

auto Fbs_Facility_Store::findFacility(std::string_view name) const
    -> Fbs_Facility * {
  auto iter = m_facilities.find(std::string{name});
  if (iter == m_facilities.end()) {
    return nullptr;
  }

  return iter->second.get();
}

auto Fbs_Facility_Store::findFacilityOfBooking(uint64_t booking_id) const
    -> Fbs_Facility * {
  std::lock_guard<std::mutex> lock(m_index_mutex);

  auto iter = m_booking_index.find(booking_id);
  if (iter == m_booking_index.end()) {
    return nullptr;
  }

  return iter->second;
}

auto Fbs_Facility_Store::moveBooking(
    uint64_t booking_id, int32_t minutes, Fbs_Mutation_Kind kind,
    const std::function<std::optional<Fbs_Interval>(const Fbs_Interval &)>
        &move) -> std::expected<Fbs_Interval, Fbs_Status> {
  auto *facility = findFacilityOfBooking(booking_id);
  if (nullptr == facility) {
    return std::unexpected(Fbs_Status::kBookingNotFound);
  }

  if (0 == minutes || std::abs(static_cast<int64_t>(minutes)) >=
                          static_cast<int64_t>(kMinutesPerWeek)) {
    return std::unexpected(Fbs_Status::kInvalidRequest);
  }

  std::lock_guard<std::mutex> lock(facility->mutex);

  auto iter = std::find_if(
      facility->bookings.begin(), facility->bookings.end(),
      [booking_id](const Fbs_Booking &booking) {
        return booking.id == booking_id;
      });
  if (iter == facility->bookings.end()) {
    return std::unexpected(Fbs_Status::kBookingNotFound);
  }

  const Fbs_Interval previous = iter->interval;

  auto candidate = move(previous);
  if (!candidate || !candidate->isValid()) {
    return std::unexpected(Fbs_Status::kInvalidInterval);
  }

  if (overlapsAny(*facility, *candidate, booking_id)) {
    return std::unexpected(Fbs_Status::kOverlap);
  }

  Fbs_Booking moved{*iter};
  moved.interval = *candidate;

  facility->bookings.erase(iter);
  insertSorted(*facility, moved);

  FBS_DEBUG_PRINT(std::cerr << mutationKindName(kind) << " "
                            << toHex(booking_id) << " on " << facility->name
                            << ": " << previous << " -> " << *candidate
                            << "\n");

  notify(Fbs_Mutation_Event{facility->name, kind, booking_id, *candidate,
                            previous});

  return *candidate;
}

auto Fbs_Facility_Store::overlapsAny(const Fbs_Facility &facility,
                                     const Fbs_Interval &interval,
                                     uint64_t except_id) -> bool {
  return std::any_of(facility.bookings.begin(), facility.bookings.end(),
                     [&interval, except_id](const Fbs_Booking &booking) {
                       return booking.id != except_id &&
                              booking.interval.overlaps(interval);
                     });
}

void Fbs_Facility_Store::insertSorted(Fbs_Facility &facility,
                                      Fbs_Booking booking) {
  auto pos = std::upper_bound(
      facility.bookings.begin(), facility.bookings.end(),
      booking.interval.start,
      [](const Fbs_Time_Point &start, const Fbs_Booking &other) {
        return start < other.interval.start;
      });

  facility.bookings.insert(pos, std::move(booking));
}

void Fbs_Facility_Store::notify(const Fbs_Mutation_Event &event) const {
  if (m_listener) {
    m_listener(event);
  }
}

} // namespace fbs
