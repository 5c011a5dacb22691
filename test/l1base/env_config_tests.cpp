#include <doctest/doctest.h>

#include <cstdint>
#include <cstdlib>
#include <string>

#include "l1base/cli/verbosity.hpp"
#include "l1base/env_config.hpp"

namespace {

struct scoped_env {
  scoped_env(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
  ~scoped_env() { unsetenv(name_); }

  const char* name_;
};

} // namespace

TEST_CASE("l1base env_config prefixes variable names") {
  l1::util::env_config env("L1TEST");
  CHECK(env.env_name("VERBOSE") == "L1TEST_VERBOSE");

  l1::util::env_config already("L1TEST_");
  CHECK(already.env_name("VERBOSE") == "L1TEST_VERBOSE");
}

TEST_CASE("l1base env_config falls back to defaults when unset") {
  l1::util::env_config env("L1TEST_UNSET");
  CHECK(env.get<int>("VERBOSE", 3) == 3);
  CHECK(env.get<std::string>("SYMBOL", "jni_loader_iter_libs") == "jni_loader_iter_libs");
  CHECK(env.get<bool>("DUMP", true));
  CHECK_FALSE(env.has("VERBOSE"));
}

TEST_CASE("l1base env_config parses typed values") {
  scoped_env verbose("L1TEST_VERBOSE", "2");
  scoped_env records("L1TEST_MAX_RECORDS", "0x100");
  scoped_env dump("L1TEST_DUMP", " off ");
  scoped_env symbol("L1TEST_SYMBOL", "custom_iter");

  l1::util::env_config env("L1TEST");
  CHECK(env.get<int>("VERBOSE", 0) == 2);
  CHECK(env.get<uint64_t>("MAX_RECORDS", 0) == 0x100);
  CHECK_FALSE(env.get<bool>("DUMP", true));
  CHECK(env.get<std::string>("SYMBOL", "") == "custom_iter");
  CHECK(env.has("SYMBOL"));
}

TEST_CASE("l1base env_config keeps default on malformed numbers") {
  scoped_env records("L1TEST_MAX_RECORDS", "12abc");
  scoped_env flag("L1TEST_FLAG", "maybe");

  l1::util::env_config env("L1TEST");
  CHECK(env.get<uint64_t>("MAX_RECORDS", 7) == 7);
  CHECK(env.get<bool>("FLAG", true));
}

TEST_CASE("l1base verbosity ladder clamps") {
  CHECK(l1::cli::level_from_verbosity(-1) == redlog::level::info);
  CHECK(l1::cli::level_from_verbosity(2) == redlog::level::trace);
  CHECK(l1::cli::level_from_verbosity(9) == redlog::level::pedantic);
  CHECK(std::string(l1::cli::verbosity_name(3)) == "debug");
}
