#include <doctest/doctest.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "l1bridge/loader_bridge.hpp"
#include "l1host/entry_points.hpp"
#include "l1host/library_loader.hpp"
#include "l1host/library_registry.hpp"

namespace {

int g_iter_calls = 0;

l1::bridge::bridge_config enumerate_only(const char* iter_symbol) {
  l1::bridge::bridge_config config{};
  config.iter_symbol = iter_symbol;
  config.loaded_symbol = "l1_test_loaded_absent";
  return config;
}

} // namespace

extern "C" {

L1_HOST_EXPORT void l1_test_iter_two_records(l1_iter_callback callback) {
  static const l1::host::library_record records[] = {
      {0x1000, "libc.so"},
      {0x2000, nullptr},
  };
  g_iter_calls += 1;
  callback(records, 2);
}

L1_HOST_EXPORT void l1_test_iter_silent(l1_iter_callback) { g_iter_calls += 1; }
}

using l1::bridge::bridge_error;
using l1::bridge::capability;
using l1::bridge::library_load_event;
using l1::bridge::mapped_library;

TEST_CASE("l1bridge enumerates records reported by the host") {
  g_iter_calls = 0;
  l1::bridge::loader_bridge bridge;
  bridge.setup(enumerate_only("l1_test_iter_two_records"));
  REQUIRE(bridge.available(capability::enumerate));

  auto result = bridge.get_mapped_libs();
  REQUIRE(result.ok());
  CHECK(g_iter_calls == 1);

  const std::vector<mapped_library> expected = {{0x1000, "libc.so"}, {0x2000, ""}};
  CHECK(result.libraries == expected);

  const auto& entry = bridge.entry(capability::enumerate);
  REQUIRE(entry.has_value());
  CHECK(entry->name == "l1_test_iter_two_records");
  CHECK(entry->address == reinterpret_cast<void*>(&l1_test_iter_two_records));
}

TEST_CASE("l1bridge returns equal snapshots without intervening loads") {
  l1::bridge::loader_bridge bridge;
  bridge.setup(enumerate_only("l1_test_iter_two_records"));

  auto first = bridge.get_mapped_libs();
  auto second = bridge.get_mapped_libs();
  REQUIRE(first.ok());
  REQUIRE(second.ok());
  CHECK(first.libraries == second.libraries);
}

TEST_CASE("l1bridge treats a silent host as an empty list") {
  g_iter_calls = 0;
  l1::bridge::loader_bridge bridge;
  bridge.setup(enumerate_only("l1_test_iter_silent"));

  auto result = bridge.get_mapped_libs();
  CHECK(result.ok());
  CHECK(result.libraries.empty());
  CHECK(g_iter_calls == 1);
}

TEST_CASE("l1bridge rejects record counts over the limit") {
  auto config = enumerate_only("l1_test_iter_two_records");
  config.max_records = 1;

  l1::bridge::loader_bridge bridge;
  bridge.setup(config);

  auto result = bridge.get_mapped_libs();
  CHECK(result.status.code == bridge_error::invalid_record_count);
  CHECK(result.libraries.empty());
}

TEST_CASE("l1bridge disables enumeration when the entry point is missing") {
  g_iter_calls = 0;
  l1::bridge::bridge_config config{};
  config.iter_symbol = "l1_test_iter_absent";

  l1::bridge::loader_bridge bridge;
  auto status = bridge.setup(config);
  CHECK(status.code == bridge_error::capability_unavailable);

  CHECK_FALSE(bridge.available(capability::enumerate));
  CHECK(bridge.available(capability::load_events));
  CHECK_FALSE(bridge.entry(capability::enumerate).has_value());

  REQUIRE(bridge.diagnostics().size() == 1);
  CHECK(bridge.diagnostics()[0].which == capability::enumerate);
  CHECK(bridge.diagnostics()[0].message.find("l1_test_iter_absent") != std::string::npos);

  auto result = bridge.get_mapped_libs();
  CHECK(result.status.code == bridge_error::capability_unavailable);
  CHECK(result.libraries.empty());
  CHECK(g_iter_calls == 0);

  // discovery is not retried
  CHECK(bridge.setup(config).ok());
  CHECK(bridge.diagnostics().size() == 1);
}

TEST_CASE("l1bridge keeps enumeration when the load entry point is missing") {
  g_iter_calls = 0;
  l1::bridge::loader_bridge bridge;
  auto status = bridge.setup(enumerate_only("l1_test_iter_two_records"));
  CHECK(status.code == bridge_error::capability_unavailable);

  CHECK_FALSE(bridge.available(capability::load_events));
  CHECK(bridge.available(capability::enumerate));
  CHECK_FALSE(bridge.entry(capability::load_events).has_value());

  REQUIRE(bridge.diagnostics().size() == 1);
  CHECK(bridge.diagnostics()[0].which == capability::load_events);
  CHECK(bridge.diagnostics()[0].message.find("l1_test_loaded_absent") != std::string::npos);

  auto result = bridge.get_mapped_libs();
  REQUIRE(result.ok());
  CHECK(result.libraries.size() == 2);
  CHECK(g_iter_calls == 1);
}

TEST_CASE("l1bridge reports a load hook that cannot be installed") {
  l1::bridge::loader_bridge holder;
  REQUIRE(holder.setup().ok());
  REQUIRE(holder.available(capability::load_events));

  l1::bridge::bridge_config config{};
  config.iter_symbol = "l1_test_iter_two_records";
  l1::bridge::loader_bridge second;
  auto status = second.setup(config);
  CHECK(status.code == bridge_error::hook_failed);

  CHECK_FALSE(second.available(capability::load_events));
  CHECK(second.available(capability::enumerate));
  CHECK(second.entry(capability::load_events).has_value());

  REQUIRE(second.diagnostics().size() == 1);
  CHECK(second.diagnostics()[0].which == capability::load_events);
  CHECK(second.diagnostics()[0].message.find("already_hooked") != std::string::npos);

  CHECK(second.get_mapped_libs().ok());

  // the first bridge still owns the hook
  int calls = 0;
  holder.observer().set([&](const library_load_event&) { calls += 1; });
  jni_loader_lib_loaded(0xb000, "libheld.so");
  CHECK(calls == 1);
}

TEST_CASE("l1bridge forwards host load announcements to the observer") {
  l1::bridge::loader_bridge bridge;
  REQUIRE(bridge.setup().ok());
  REQUIRE(bridge.available(capability::load_events));

  std::vector<library_load_event> events;
  bridge.observer().set([&](const library_load_event& event) { events.push_back(event); });

  const auto before = l1::host::load_notifications();
  l1::host::library_registry registry;
  REQUIRE(registry.add(0x3000, "libssl.so") == l1::host::registry_error::ok);

  REQUIRE(events.size() == 1);
  CHECK(events[0].base_address == 0x3000);
  CHECK(events[0].name == "libssl.so");

  // the host's own function still runs after the observer
  const auto after = l1::host::load_notifications();
  CHECK(after.calls == before.calls + 1);
  CHECK(after.last_base == 0x3000);

  jni_loader_lib_loaded(0x5000, nullptr);
  REQUIRE(events.size() == 2);
  CHECK(events[1].base_address == 0x5000);
  CHECK(events[1].name.empty());
}

TEST_CASE("l1bridge delivers only to the replacement observer") {
  l1::bridge::loader_bridge bridge;
  REQUIRE(bridge.setup().ok());

  int first = 0;
  int second = 0;
  bridge.observer().set([&](const library_load_event&) { first += 1; });
  bridge.observer().set([&](const library_load_event&) { second += 1; });

  jni_loader_lib_loaded(0x6000, "libreplaced.so");
  CHECK(first == 0);
  CHECK(second == 1);
}

TEST_CASE("l1bridge drops announcements without an observer") {
  l1::bridge::loader_bridge bridge;
  REQUIRE(bridge.setup().ok());

  const auto before = l1::host::load_notifications();
  jni_loader_lib_loaded(0x7000, "libunobserved.so");
  const auto after = l1::host::load_notifications();
  CHECK(after.calls == before.calls + 1);
  CHECK(after.last_base == 0x7000);
}

TEST_CASE("l1bridge contains observer exceptions inside the load hook") {
  l1::bridge::loader_bridge bridge;
  REQUIRE(bridge.setup().ok());

  int calls = 0;
  bridge.observer().set([&](const library_load_event&) {
    calls += 1;
    throw std::runtime_error("observer failure");
  });

  const auto before = l1::host::load_notifications();
  jni_loader_lib_loaded(0xc000, "libthrow.so");
  const auto after = l1::host::load_notifications();

  CHECK(calls == 1);
  CHECK(after.calls == before.calls + 1);
  CHECK(after.last_base == 0xc000);

  // delivery continues with the next announcement
  jni_loader_lib_loaded(0xd000, "libthrow.so");
  CHECK(calls == 2);
}

TEST_CASE("l1bridge shutdown removes the load hook") {
  int calls = 0;
  {
    l1::bridge::loader_bridge bridge;
    REQUIRE(bridge.setup().ok());
    bridge.observer().set([&](const library_load_event&) { calls += 1; });

    jni_loader_lib_loaded(0x8000, "libfirst.so");
    CHECK(calls == 1);

    bridge.shutdown();
    CHECK_FALSE(bridge.initialized());
    CHECK_FALSE(bridge.available(capability::load_events));
    jni_loader_lib_loaded(0x8000, "libfirst.so");
    CHECK(calls == 1);

    // a shut down bridge can be set up again
    REQUIRE(bridge.setup().ok());
    jni_loader_lib_loaded(0x9000, "libsecond.so");
    CHECK(calls == 2);
  }

  jni_loader_lib_loaded(0xa000, "libthird.so");
  CHECK(calls == 2);
}

TEST_CASE("l1bridge observes libraries mapped by the host loader") {
  l1::bridge::loader_bridge bridge;
  REQUIRE(bridge.setup().ok());

  std::vector<library_load_event> events;
  bridge.observer().set([&](const library_load_event& event) { events.push_back(event); });

  l1::host::library_loader loader;
  auto loaded = loader.load(L1_SAMPLE_LIBRARY_PATH);
  REQUIRE(loaded.ok());

  REQUIRE(events.size() == 1);
  CHECK(events[0].base_address == loaded.library.base_address);
  CHECK(events[0].name == L1_SAMPLE_LIBRARY_PATH);

  auto snapshot = bridge.get_mapped_libs();
  REQUIRE(snapshot.ok());
  const mapped_library expected{loaded.library.base_address, L1_SAMPLE_LIBRARY_PATH};
  CHECK(std::find(snapshot.libraries.begin(), snapshot.libraries.end(), expected) != snapshot.libraries.end());

  bridge.observer().clear();
  loader.unload_all();

  auto after = bridge.get_mapped_libs();
  REQUIRE(after.ok());
  CHECK(std::find(after.libraries.begin(), after.libraries.end(), expected) == after.libraries.end());
}
