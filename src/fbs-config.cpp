/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-config.cpp
 * @brief Command-line parsing of Fbs_Server_Config and Fbs_Client_Config.
 */

#include "fbs-config.hpp"

#include <charconv>
#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "fbs-codec.hpp"
#include "fbs-util.hpp"

namespace fbs {

namespace {

struct Fbs_Option {
  std::string_view key{};
  std::optional<std::string_view> value{};
};

auto splitOption(std::string_view arg) -> std::expected<Fbs_Option, std::string> {
  if (!arg.starts_with("--") || arg.size() == 2) {
    return std::unexpected("unexpected argument '" + std::string{arg} + "'");
  }

  arg.remove_prefix(2);

  const auto equal = arg.find('=');
  if (equal == std::string_view::npos) {
    return Fbs_Option{arg, std::nullopt};
  }

  return Fbs_Option{arg.substr(0, equal), arg.substr(equal + 1)};
}

template <typename T>
auto parseInteger(const Fbs_Option &option, T min, T max)
    -> std::expected<T, std::string> {
  T value{};

  if (!option.value) {
    return std::unexpected("--" + std::string{option.key} + " needs a value");
  }

  const auto text = *option.value;
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value < min ||
      value > max) {
    return std::unexpected("invalid value '" + std::string{text} + "' for --" +
                           std::string{option.key});
  }

  return value;
}

auto parseProbability(const Fbs_Option &option)
    -> std::expected<double, std::string> {
  double value{};

  if (!option.value) {
    return std::unexpected("--" + std::string{option.key} + " needs a value");
  }

  const auto text = *option.value;
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() ||
      !(value >= 0.0 && value <= 1.0)) {
    return std::unexpected("invalid probability '" + std::string{text} +
                           "' for --" + std::string{option.key});
  }

  return value;
}

auto parseFlag(const Fbs_Option &option) -> std::expected<bool, std::string> {
  if (!option.value) {
    return true;
  }

  if (stringCompare(*option.value, "true") || *option.value == "1") {
    return true;
  }

  if (stringCompare(*option.value, "false") || *option.value == "0") {
    return false;
  }

  return std::unexpected("invalid value '" + std::string{*option.value} +
                         "' for --" + std::string{option.key});
}

/**
 * Options understood by both executables: loss simulation and seed.
 *
 * @return true if @p option was one of them, std::unexpected if it was but
 *         its value is wrong.
 */
auto parseSimOption(const Fbs_Option &option, Fbs_Sim_Config &sim)
    -> std::expected<bool, std::string> {
  if (option.key == "drop") {
    auto value = parseProbability(option);
    if (!value) {
      return std::unexpected(value.error());
    }

    sim.p_drop = *value;
  } else if (option.key == "duplicate") {
    auto value = parseProbability(option);
    if (!value) {
      return std::unexpected(value.error());
    }

    sim.p_duplicate = *value;
  } else if (option.key == "drop-inbound") {
    auto value = parseFlag(option);
    if (!value) {
      return std::unexpected(value.error());
    }

    sim.drop_inbound = *value;
  } else if (option.key == "seed") {
    auto value = parseInteger<uint64_t>(option, 0, UINT64_MAX);
    if (!value) {
      return std::unexpected(value.error());
    }

    sim.seed = *value;
  } else {
    return false;
  }

  return true;
}

} // namespace

auto parseServerConfig(int argc, const char *const argv[])
    -> std::expected<Fbs_Server_Config, std::string> {
  Fbs_Server_Config config{};
  bool default_facilities{true};

  for (int i = 1; i < argc; ++i) {
    auto option = splitOption(argv[i]);
    if (!option) {
      return std::unexpected(option.error());
    }

    auto sim_option = parseSimOption(*option, config.sim);
    if (!sim_option) {
      return std::unexpected(sim_option.error());
    }

    if (*sim_option) {
      if (option->key == "seed") {
        config.seed = config.sim.seed;
      }

      continue;
    }

    if (option->key == "port") {
      auto value = parseInteger<int>(*option, 0, 65535);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.port = *value;
    } else if (option->key == "no-reply-cache") {
      auto value = parseFlag(*option);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.use_reply_cache = !*value;
    } else if (option->key == "cache-retention-ms") {
      auto value = parseInteger<int64_t>(*option, 1, INT64_MAX / 1000000);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.cache_retention = std::chrono::milliseconds{*value};
    } else if (option->key == "workers") {
      auto value = parseInteger<size_t>(*option, 1, 256);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.workers = *value;
    } else if (option->key == "facility") {
      if (!option->value || !isValidFacilityName(*option->value)) {
        return std::unexpected("invalid facility name for --facility");
      }

      if (default_facilities) {
        config.facilities.clear();
        default_facilities = false;
      }

      config.facilities.emplace_back(*option->value);
    } else if (option->key == "max-monitor-sec") {
      auto value = parseInteger<int64_t>(*option, 1, INT32_MAX);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.max_monitor = std::chrono::seconds{*value};
    } else {
      return std::unexpected("unknown option --" + std::string{option->key});
    }
  }

  return config;
}

auto parseClientConfig(int argc, const char *const argv[])
    -> std::expected<Fbs_Client_Config, std::string> {
  Fbs_Client_Config config{};

  for (int i = 1; i < argc; ++i) {
    auto option = splitOption(argv[i]);
    if (!option) {
      return std::unexpected(option.error());
    }

    auto sim_option = parseSimOption(*option, config.sim);
    if (!sim_option) {
      return std::unexpected(sim_option.error());
    }

    if (*sim_option) {
      continue;
    }

    if (option->key == "server") {
      auto address = option->value ? Fbs_Address::fromString(*option->value)
                                   : std::nullopt;
      if (!address) {
        return std::unexpected("invalid address for --server, want IP:PORT");
      }

      config.server = *address;
    } else if (option->key == "port") {
      auto value = parseInteger<int>(*option, 0, 65535);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.port = *value;
    } else if (option->key == "timeout-ms") {
      auto value = parseInteger<int64_t>(*option, 1, INT32_MAX);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.timeout = std::chrono::milliseconds{*value};
    } else if (option->key == "retries") {
      auto value = parseInteger<uint32_t>(*option, 0, 1000);
      if (!value) {
        return std::unexpected(value.error());
      }

      config.retries = *value;
    } else if (option->key == "client-id") {
      auto value = option->value ? fromHex(*option->value) : std::nullopt;
      if (!value || 0 == *value) {
        return std::unexpected("invalid value for --client-id, want 1 to 16 "
                               "hex digits, not all zero");
      }

      config.client_id = *value;
    } else {
      return std::unexpected("unknown option --" + std::string{option->key});
    }
  }

  return config;
}

auto serverUsage() -> std::string {
  return "usage: fbs-server [--port=N] [--drop=P] [--duplicate=P] "
         "[--drop-inbound]\n"
         "                  [--no-reply-cache] [--cache-retention-ms=N] "
         "[--workers=N]\n"
         "                  [--facility=NAME ...] [--max-monitor-sec=N] "
         "[--seed=N]\n";
}

auto clientUsage() -> std::string {
  return "usage: fbs-client [--server=IP:PORT] [--port=N] [--timeout-ms=N] "
         "[--retries=N]\n"
         "                  [--drop=P] [--duplicate=P] [--drop-inbound] "
         "[--client-id=HEX]\n"
         "                  [--seed=N]\n";
}

} // namespace fbs
