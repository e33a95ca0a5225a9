/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file fbs-test-config.cpp
 * @brief The unit test for fbs-config module: command-line parsing of the
 *        server and client settings.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "fbs-config.hpp"

namespace {

void testServerDefaults() {
  const char *const argv[] = {"fbs-server"};

  auto config = fbs::parseServerConfig(1, argv);
  EXPECT_TRUE(config);
  EXPECT_TRUE(FBS_DEFAULT_PORT == config->port);
  EXPECT_TRUE(config->use_reply_cache);
  EXPECT_TRUE(std::chrono::milliseconds{FBS_DEFAULT_CACHE_RETENTION_MS} ==
              config->cache_retention);
  EXPECT_TRUE(FBS_DEFAULT_WORKERS == config->workers);
  EXPECT_TRUE(4 == config->facilities.size());
  EXPECT_TRUE("Room101" == config->facilities[0]);
  EXPECT_TRUE(0.0 == config->sim.p_drop);
  EXPECT_FALSE(config->sim.seed);
  EXPECT_FALSE(config->seed);
}

void testServerOptions() {
  const char *const argv[] = {"fbs-server",
                              "--port=0",
                              "--drop=0.25",
                              "--duplicate=1",
                              "--drop-inbound",
                              "--no-reply-cache",
                              "--cache-retention-ms=500",
                              "--workers=2",
                              "--facility=Studio",
                              "--facility=Pool",
                              "--max-monitor-sec=60",
                              "--seed=12345"};

  auto config = fbs::parseServerConfig(12, argv);
  EXPECT_TRUE(config);
  EXPECT_TRUE(0 == config->port);
  EXPECT_TRUE(0.25 == config->sim.p_drop);
  EXPECT_TRUE(1.0 == config->sim.p_duplicate);
  EXPECT_TRUE(config->sim.drop_inbound);
  EXPECT_FALSE(config->use_reply_cache);
  EXPECT_TRUE(std::chrono::milliseconds{500} == config->cache_retention);
  EXPECT_TRUE(2 == config->workers);
  EXPECT_TRUE((std::vector<std::string>{"Studio", "Pool"} ==
               config->facilities));
  EXPECT_TRUE(std::chrono::seconds{60} == config->max_monitor);
  EXPECT_TRUE(config->sim.seed && 12345 == *config->sim.seed);
  EXPECT_TRUE(config->seed && 12345 == *config->seed);

  const char *const cache_on[] = {"fbs-server", "--no-reply-cache=false"};
  auto cache_config = fbs::parseServerConfig(2, cache_on);
  EXPECT_TRUE(cache_config && cache_config->use_reply_cache);
}

void testServerErrors() {
  const std::vector<std::string> bad_args{
      "--port=70000",      "--port",          "--drop=1.5",
      "--duplicate=-0.1",  "--workers=0",     "--facility=",
      "--bogus",           "plain",           "--no-reply-cache=maybe",
      "--max-monitor-sec=0", "--cache-retention-ms=x", "--"};

  for (const auto &arg : bad_args) {
    const char *const argv[] = {"fbs-server", arg.c_str()};

    auto config = fbs::parseServerConfig(2, argv);
    EXPECT_FALSE(config);
    EXPECT_FALSE(config.error().empty());
  }
}

void testClientOptions() {
  const char *const defaults[] = {"fbs-client"};

  auto config = fbs::parseClientConfig(1, defaults);
  EXPECT_TRUE(config);
  EXPECT_TRUE("127.0.0.1" == config->server.ip4);
  EXPECT_TRUE(FBS_DEFAULT_PORT == config->server.port);
  EXPECT_TRUE(0 == config->port);
  EXPECT_TRUE(std::chrono::milliseconds{FBS_DEFAULT_TIMEOUT_MS} ==
              config->timeout);
  EXPECT_TRUE(FBS_DEFAULT_RETRIES == config->retries);
  EXPECT_FALSE(config->client_id);

  const char *const argv[] = {"fbs-client",        "--server=10.0.0.7:4000",
                              "--port=5000",       "--timeout-ms=250",
                              "--retries=0",       "--drop=0.5",
                              "--client-id=00ff",  "--seed=7"};

  config = fbs::parseClientConfig(8, argv);
  EXPECT_TRUE(config);
  EXPECT_TRUE("10.0.0.7" == config->server.ip4);
  EXPECT_TRUE(4000 == config->server.port);
  EXPECT_TRUE(5000 == config->port);
  EXPECT_TRUE(std::chrono::milliseconds{250} == config->timeout);
  EXPECT_TRUE(0 == config->retries);
  EXPECT_TRUE(0.5 == config->sim.p_drop);
  EXPECT_TRUE(config->client_id && 0xff == *config->client_id);
  EXPECT_TRUE(config->sim.seed && 7 == *config->sim.seed);

  const std::vector<std::string> bad_args{
      "--server=10.0.0.7",  "--server=host:80", "--timeout-ms=0",
      "--client-id=0",      "--client-id=xyz",  "--retries=-1",
      "--workers=2"};

  for (const auto &arg : bad_args) {
    const char *const bad_argv[] = {"fbs-client", arg.c_str()};

    EXPECT_FALSE(fbs::parseClientConfig(2, bad_argv));
  }

  EXPECT_FALSE(fbs::serverUsage().empty());
  EXPECT_TRUE(fbs::clientUsage().find("--server") != std::string::npos);
}

} // namespace

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  testServerDefaults();
  testServerOptions();
  testServerErrors();
  testClientOptions();

  return RUN_ALL_TESTS();
}
