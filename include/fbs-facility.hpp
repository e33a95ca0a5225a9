/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-facility.hpp
 * @brief Fbs_Facility_Store: the facilities, their weekly calendars and the
 *        booking operations on them.
 *
 * The set of facilities is fixed at construction. Each facility keeps its
 * bookings in a vector sorted by start time, pairwise non-overlapping under
 * half-open semantics ([start, end)). Every operation checks before it
 * mutates, so a failed operation leaves the store as it was.
 *
 * Concurrency:
 *  - every facility has its own mutex, operations on different facilities
 *    run in parallel;
 *  - the booking index (booking id -> facility) has a mutex of its own and
 *    is only ever locked after, never before, a facility mutex;
 *  - the mutation listener is called while the mutated facility is still
 *    locked, so listeners observe the mutations of one facility in the
 *    order they took effect. A listener must not call back into the store.
 *
 * Failures are returned as std::unexpected(Fbs_Status).
 */

#ifndef FBS_FACILITY_HPP_
#define FBS_FACILITY_HPP_

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "fbs-message.hpp"
#include "fbs-time.hpp"

namespace fbs {

class Fbs_Facility_Store {
public:
  using Mutation_Listener = std::function<void(const Fbs_Mutation_Event &)>;

  /**
   * @param names   Facilities to create, duplicates are collapsed.
   * @param id_seed Seed of the booking id counter, random when unset.
   *
   * @throws std::invalid_argument if a name is empty or too long.
   */
  explicit Fbs_Facility_Store(const std::vector<std::string> &names,
                              std::optional<uint64_t> id_seed = {});
  virtual ~Fbs_Facility_Store() noexcept = default;

  Fbs_Facility_Store(const Fbs_Facility_Store &obj) = delete;
  const Fbs_Facility_Store &operator=(const Fbs_Facility_Store &obj) = delete;
  Fbs_Facility_Store(Fbs_Facility_Store &&obj) = delete;
  Fbs_Facility_Store &operator=(Fbs_Facility_Store &&obj) = delete;

  /**
   * @brief Install the callback run on every successful mutation. Must be
   *        called before the store is shared between threads.
   */
  void setMutationListener(Mutation_Listener listener);

  auto hasFacility(std::string_view name) const -> bool;
  auto getFacilityNames() const -> std::vector<std::string>;

  /**
   * @brief Booked intervals per requested day, days ascending and
   *        deduplicated. A booking spanning several days is listed under
   *        each requested day it touches.
   */
  auto queryAvailability(std::string_view name,
                         const std::vector<uint32_t> &days) const
      -> std::expected<std::vector<Fbs_Day_Bookings>, Fbs_Status>;

  auto book(std::string_view name, const Fbs_Interval &interval,
            uint64_t client_id = 0) -> std::expected<uint64_t, Fbs_Status>;

  /**
   * @brief Move both ends of a booking by @p offset minutes. Only the
   *        other bookings of the facility count for the overlap check.
   */
  auto shift(uint64_t booking_id, int32_t offset)
      -> std::expected<Fbs_Interval, Fbs_Status>;

  /**
   * @brief Move the end of a booking by @p minutes, negative shortens it.
   */
  auto extend(uint64_t booking_id, int32_t minutes)
      -> std::expected<Fbs_Interval, Fbs_Status>;

  auto getBooking(uint64_t booking_id) const
      -> std::expected<Fbs_Booking_Record, Fbs_Status>;

  /**
   * @brief All bookings of a facility in start order.
   */
  auto getBookings(std::string_view name) const
      -> std::expected<std::vector<Fbs_Booking_Record>, Fbs_Status>;

private:
  struct Fbs_Booking {
    uint64_t id{};
    Fbs_Interval interval{};
    uint64_t client_id{};
  };

  struct Fbs_Facility {
    std::string name{};
    mutable std::mutex mutex{};
    std::vector<Fbs_Booking> bookings{};
  };

  auto findFacility(std::string_view name) const -> Fbs_Facility *;
  auto findFacilityOfBooking(uint64_t booking_id) const -> Fbs_Facility *;

  /**
   * @brief Common part of shift and extend: validate @p minutes, let
   *        @p move compute the candidate interval, check it and apply it.
   */
  auto moveBooking(
      uint64_t booking_id, int32_t minutes, Fbs_Mutation_Kind kind,
      const std::function<std::optional<Fbs_Interval>(const Fbs_Interval &)>
          &move) -> std::expected<Fbs_Interval, Fbs_Status>;

  static auto overlapsAny(const Fbs_Facility &facility,
                          const Fbs_Interval &interval,
                          uint64_t except_id = 0) -> bool;
  static void insertSorted(Fbs_Facility &facility, Fbs_Booking booking);

  void notify(const Fbs_Mutation_Event &event) const;

  std::unordered_map<std::string, std::unique_ptr<Fbs_Facility>>
      m_facilities{};

  mutable std::mutex m_index_mutex{};
  std::unordered_map<uint64_t, Fbs_Facility *> m_booking_index{};
  uint64_t m_last_id{};

  Mutation_Listener m_listener{};
}; // class Fbs_Facility_Store

} // namespace fbs

#endif // FBS_FACILITY_HPP_
