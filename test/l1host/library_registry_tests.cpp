#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "l1host/library_record.hpp"
#include "l1host/library_registry.hpp"

namespace {

struct announcement {
  uint64_t base = 0;
  std::string name;
};

std::vector<announcement> g_announcements;

void record_announcement(uint64_t base, const char* name) { g_announcements.push_back({base, name ? name : ""}); }

struct iterated {
  int calls = 0;
  std::vector<announcement> records;
};

iterated g_iterated;

void collect(const l1::host::library_record* records, size_t count) {
  g_iterated.calls += 1;
  for (size_t i = 0; i < count; ++i) {
    g_iterated.records.push_back({records[i].base_address, records[i].name ? records[i].name : ""});
  }
}

} // namespace

TEST_CASE("l1host registry publishes records in ascending base order") {
  g_announcements.clear();
  g_iterated = {};

  l1::host::library_registry registry(&record_announcement);
  CHECK(registry.add(0x7000, "libz.so") == l1::host::registry_error::ok);
  CHECK(registry.add(0x1000, "libc.so") == l1::host::registry_error::ok);
  CHECK(registry.add(0x4000, "") == l1::host::registry_error::ok);
  CHECK(registry.size() == 3);

  registry.iterate(&collect);
  CHECK(g_iterated.calls == 1);
  REQUIRE(g_iterated.records.size() == 3);
  CHECK(g_iterated.records[0].base == 0x1000);
  CHECK(g_iterated.records[0].name == "libc.so");
  CHECK(g_iterated.records[1].base == 0x4000);
  CHECK(g_iterated.records[1].name.empty());
  CHECK(g_iterated.records[2].base == 0x7000);
  CHECK(g_iterated.records[2].name == "libz.so");
}

TEST_CASE("l1host registry announces every added library") {
  g_announcements.clear();

  l1::host::library_registry registry(&record_announcement);
  REQUIRE(registry.add(0x3000, "libssl.so") == l1::host::registry_error::ok);
  REQUIRE(g_announcements.size() == 1);
  CHECK(g_announcements[0].base == 0x3000);
  CHECK(g_announcements[0].name == "libssl.so");

  // same base replaces the stored name and is announced again
  REQUIRE(registry.add(0x3000, "libssl.so.3") == l1::host::registry_error::ok);
  CHECK(registry.size() == 1);
  REQUIRE(g_announcements.size() == 2);
  CHECK(g_announcements[1].name == "libssl.so.3");
}

TEST_CASE("l1host registry rejects invalid entries") {
  g_announcements.clear();

  l1::host::library_registry registry(&record_announcement);
  CHECK(registry.add(0, "libc.so") == l1::host::registry_error::invalid_base);
  CHECK(registry.add(0x1000, std::string_view("lib\0c.so", 8)) == l1::host::registry_error::invalid_name);
  CHECK(registry.size() == 0);
  CHECK(g_announcements.empty());
}

TEST_CASE("l1host registry iterates once when empty") {
  g_iterated = {};

  l1::host::library_registry registry(nullptr);
  registry.iterate(&collect);
  CHECK(g_iterated.calls == 1);
  CHECK(g_iterated.records.empty());

  registry.iterate(nullptr);
  CHECK(g_iterated.calls == 1);
}

TEST_CASE("l1host registry removes and clears entries") {
  l1::host::library_registry registry(nullptr);
  REQUIRE(registry.add(0x1000, "libc.so") == l1::host::registry_error::ok);
  REQUIRE(registry.add(0x2000, "libm.so") == l1::host::registry_error::ok);

  CHECK(registry.remove(0x1000));
  CHECK_FALSE(registry.remove(0x1000));

  auto snapshot = registry.snapshot();
  REQUIRE(snapshot.size() == 1);
  CHECK(snapshot[0].base_address == 0x2000);
  CHECK(snapshot[0].name == "libm.so");

  registry.clear();
  CHECK(registry.size() == 0);
}

TEST_CASE("l1host entry point counts announcements") {
  const auto before = l1::host::load_notifications();
  jni_loader_lib_loaded(0x9000, "libdirect.so");
  const auto after = l1::host::load_notifications();

  CHECK(after.calls == before.calls + 1);
  CHECK(after.last_base == 0x9000);
}
