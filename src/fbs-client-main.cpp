/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-client-main.cpp
 * @brief Entry point of the interactive fbs-client.
 *
 * Reads a menu choice and its parameters from stdin, runs the call and
 * prints the reply. Availability replies are printed both as the booked
 * intervals and as the free slots of each day.
 */

#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

#include "fbs.hpp"

namespace {

auto prompt(std::string_view text) -> std::optional<std::string> {
  std::string line{};

  std::cout << text << std::flush;
  if (!std::getline(std::cin, line)) {
    return {};
  }

  return line;
}

auto parseInt(std::string_view text) -> std::optional<int32_t> {
  int32_t value{};

  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }

  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return {};
  }

  return value;
}

auto promptTimePoint(std::string_view text)
    -> std::optional<fbs::Fbs_Time_Point> {
  auto line = prompt(text);
  if (!line) {
    return {};
  }

  auto time_point = fbs::parseTimePoint(*line);
  if (!time_point) {
    std::cout << "invalid time, expected e.g. \"Mon 09:30\"\n";
  }

  return time_point;
}

auto promptBookingId() -> std::optional<uint64_t> {
  auto line = prompt("booking id: ");
  if (!line) {
    return {};
  }

  auto booking_id = fbs::fromHex(*line);
  if (!booking_id) {
    std::cout << "invalid booking id, expected up to 16 hex digits\n";
  }

  return booking_id;
}

auto promptMinutes(std::string_view text) -> std::optional<int32_t> {
  auto line = prompt(text);
  if (!line) {
    return {};
  }

  auto minutes = parseInt(*line);
  if (!minutes) {
    std::cout << "invalid number of minutes\n";
  }

  return minutes;
}

auto promptDays() -> std::optional<std::vector<uint32_t>> {
  std::vector<uint32_t> days{};
  std::string word{};

  auto line = prompt("days (e.g. Mon Wed Fri): ");
  if (!line) {
    return {};
  }

  std::istringstream words{*line};
  while (words >> word) {
    auto day = fbs::parseDay(word);
    if (!day) {
      std::cout << "invalid day '" << word << "'\n";

      return {};
    }

    days.push_back(*day);
  }

  return days;
}

void printReply(const fbs::Fbs_Client::Result &result) {
  if (!result) {
    std::cout << (result.error().kind ==
                          fbs::Fbs_Invocation_Error::Kind::kTimeout
                      ? "timeout: "
                      : "protocol error: ")
              << result.error().message << "\n";

    return;
  }

  if (result->status != fbs::Fbs_Status::kSuccess) {
    std::cout << fbs::statusName(result->status) << ": "
              << result->errorMessage() << "\n";

    return;
  }

  std::visit(
      [](const auto &body) {
        using T = std::decay_t<decltype(body)>;

        if constexpr (std::is_same_v<T, fbs::Fbs_Query_Reply>) {
          for (const auto &day : body.days) {
            std::cout << fbs::dayName(day.day) << ":\n  booked:";
            if (day.intervals.empty()) {
              std::cout << " none";
            }

            for (const auto &interval : day.intervals) {
              std::cout << "\n    " << interval;
            }

            std::cout << "\n  free:";
            for (const auto &slot : fbs::freeSlots(day.day, day.intervals)) {
              std::cout << "\n    " << slot;
            }

            std::cout << "\n";
          }
        } else if constexpr (std::is_same_v<T, fbs::Fbs_Book_Reply>) {
          std::cout << "booked, id " << fbs::toHex(body.booking_id) << "\n";
        } else if constexpr (std::is_same_v<T, fbs::Fbs_Interval_Reply>) {
          std::cout << "booking now " << body.interval << "\n";
        } else if constexpr (std::is_same_v<T, fbs::Fbs_Monitor_Reply>) {
          std::cout << "monitoring ended after " << body.duration_sec
                    << "s\n";
        } else if constexpr (std::is_same_v<T, fbs::Fbs_Booking_Record>) {
          std::cout << "booking " << fbs::toHex(body.booking_id) << " on "
                    << body.facility << ": " << body.interval << ", client "
                    << fbs::toHex(body.client_id) << "\n";
        } else {
          std::cout << body.message << "\n";
        }
      },
      result->body);
}

auto runCommand(fbs::Fbs_Client &client, std::string_view choice) -> bool {
  if (choice == "1") {
    auto facility = prompt("facility: ");
    auto days = facility ? promptDays() : std::nullopt;
    if (days) {
      printReply(client.queryAvailability(*facility, *days));
    }
  } else if (choice == "2") {
    auto facility = prompt("facility: ");
    auto start = facility ? promptTimePoint("start (Day HH:MM): ")
                          : std::nullopt;
    auto end = start ? promptTimePoint("end (Day HH:MM): ") : std::nullopt;
    if (end) {
      printReply(client.book(*facility, fbs::Fbs_Interval{*start, *end}));
    }
  } else if (choice == "3") {
    auto booking_id = promptBookingId();
    auto offset = booking_id ? promptMinutes("offset in minutes (+/-): ")
                             : std::nullopt;
    if (offset) {
      printReply(client.shift(*booking_id, *offset));
    }
  } else if (choice == "4") {
    auto facility = prompt("facility: ");
    auto seconds =
        facility ? promptMinutes("duration in seconds: ") : std::nullopt;
    if (seconds) {
      std::cout << "waiting for updates...\n";

      printReply(client.monitor(
          *facility, std::chrono::seconds{*seconds},
          [](const fbs::Fbs_Event &event) {
            std::cout << "update: " << event.mutation.toString() << std::endl;
          }));
    }
  } else if (choice == "5") {
    auto booking_id = promptBookingId();
    if (booking_id) {
      printReply(client.getBooking(*booking_id));
    }
  } else if (choice == "6") {
    auto booking_id = promptBookingId();
    auto minutes = booking_id ? promptMinutes("minutes to add (+/-): ")
                              : std::nullopt;
    if (minutes) {
      printReply(client.extend(*booking_id, *minutes));
    }
  } else if (choice == "0" || choice == "q") {
    return false;
  } else if (!choice.empty()) {
    std::cout << "unknown choice '" << choice << "'\n";
  }

  return true;
}

} // namespace

int main(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (std::string{argv[i]} == "--help") {
      std::cout << fbs::clientUsage();

      return 0;
    }
  }

  auto config = fbs::parseClientConfig(argc, argv);
  if (!config) {
    std::cerr << "fbs-client: " << config.error() << "\n"
              << fbs::clientUsage();

    return 2;
  }

  try {
    fbs::Fbs_Socket socket{"", config->port};
    fbs::Fbs_Sim_Transport transport{socket, config->sim};
    fbs::Fbs_Client client{*config, transport, transport};

    std::cout << "fbs-client " << fbs::toHex(client.getClientId()) << " on "
              << socket.localAddress().toString() << ", server "
              << config->server.toString() << "\n";

    while (true) {
      std::cout << "\n1) availability  2) book  3) shift  4) monitor  "
                   "5) get booking  6) extend  0) quit\n";

      auto choice = prompt("> ");
      if (!choice || !runCommand(client, *choice)) {
        break;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "fbs-client: " << e.what() << "\n";

    return 1;
  }

  return 0;
}
