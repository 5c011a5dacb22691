#pragma once

#include <cstdint>
#include <string>

#include "l1base/env_config.hpp"
#include "l1bridge/bridge_types.hpp"

namespace l1::agent {

struct agent_config {
  int verbose = 0;
  bridge::bridge_config bridge{};
  bool dump_on_start = true;
  // the dump runs inside the host's announcement call and holds up its loader until done
  bool dump_on_load = false;

  static agent_config from_environment() {
    util::env_config env("L1BRARIAN");
    agent_config config;

    config.verbose = env.get<int>("VERBOSE", 0);
    config.bridge.iter_symbol = env.get<std::string>("ITER_SYMBOL", bridge::kDefaultIterSymbol);
    config.bridge.loaded_symbol = env.get<std::string>("LOADED_SYMBOL", bridge::kDefaultLoadedSymbol);
    config.bridge.module = env.get<std::string>("MODULE", "");
    config.bridge.max_records =
        static_cast<size_t>(env.get<uint64_t>("MAX_RECORDS", static_cast<uint64_t>(bridge::kDefaultMaxRecords)));
    config.bridge.max_name_length =
        static_cast<size_t>(env.get<uint64_t>("MAX_NAME", static_cast<uint64_t>(bridge::kDefaultMaxNameLength)));
    config.dump_on_start = env.get<bool>("DUMP_ON_START", true);
    config.dump_on_load = env.get<bool>("DUMP_ON_LOAD", false);
    return config;
  }
};

} // namespace l1::agent
