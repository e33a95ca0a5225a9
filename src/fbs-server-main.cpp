/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-server-main.cpp
 * @brief Entry point of the fbs-server daemon.
 *
 * Binds the UDP port, wraps it in the loss-simulating transport and serves
 * requests until SIGINT or SIGTERM. SIGHUP prints the counters.
 */

#include <csignal>
#include <exception>
#include <iostream>
#include <string>

#include "fbs.hpp"

namespace {

void printStats(const fbs::Fbs_Server &server,
                const fbs::Fbs_Sim_Transport &transport) {
  const auto stats = server.getStats();
  const auto sim_stats = transport.getStats();

  std::cout << "received " << stats.received << ", executed " << stats.executed
            << ", replayed " << stats.replayed << ", malformed "
            << stats.malformed << "; sent " << sim_stats.sent << ", dropped "
            << sim_stats.dropped << ", duplicated " << sim_stats.duplicated
            << ", dropped inbound " << sim_stats.dropped_inbound << "\n";
}

} // namespace

int main(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    if (std::string{argv[i]} == "--help") {
      std::cout << fbs::serverUsage();

      return 0;
    }
  }

  auto config = fbs::parseServerConfig(argc, argv);
  if (!config) {
    std::cerr << "fbs-server: " << config.error() << "\n"
              << fbs::serverUsage();

    return 2;
  }

  try {
    fbs::Fbs_Runtime_Manager::maskSignals();

    fbs::Fbs_Runtime_Manager runtime{};
    fbs::Fbs_Socket socket{"", config->port};
    fbs::Fbs_Sim_Transport transport{socket, config->sim};
    fbs::Fbs_Server server{*config, transport, transport};

    runtime.registerSignalHandlerHook(
        SIGHUP, [&server, &transport]([[maybe_unused]] int signo) {
          printStats(server, transport);
        });

    std::cout << "fbs-server listening on " << socket.localAddress().toString()
              << ", reply cache " << (config->use_reply_cache ? "on" : "off")
              << ", drop " << config->sim.p_drop << ", duplicate "
              << config->sim.p_duplicate << "\n";

    for (const auto &name : server.getStore().getFacilityNames()) {
      std::cout << "  facility " << name << "\n";
    }

    runtime.enterMainLoop();

    printStats(server, transport);
  } catch (const std::exception &e) {
    std::cerr << "fbs-server: " << e.what() << "\n";

    return 1;
  }

  return 0;
}
