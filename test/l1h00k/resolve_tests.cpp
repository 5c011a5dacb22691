#include <doctest/doctest.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <string>

#include "l1h00k/resolve/resolve.hpp"

extern "C" {

__attribute__((visibility("default"), noinline)) int l1_test_resolve_marker(int value) { return value * 3 + 1; }

__attribute__((visibility("default"))) uint64_t l1_test_resolve_value = 0x5151;
}

using l1::h00k::hook_error;

TEST_CASE("l1h00k enumerates modules with the main executable first") {
  auto modules = l1::h00k::resolve::enumerate_modules();
  REQUIRE(!modules.empty());
  CHECK(modules.front().is_main);
  CHECK(!modules.front().path.empty());
  CHECK(modules.front().size > 0);

  auto main = l1::h00k::resolve::main_module();
  REQUIRE(main.has_value());
  CHECK(main->base == modules.front().base);
  CHECK(main->path == modules.front().path);
}

TEST_CASE("l1h00k finds exports of the main executable") {
  auto marker = l1::h00k::resolve::find_export("l1_test_resolve_marker", nullptr);
  REQUIRE(marker.error.ok());
  CHECK(marker.address == reinterpret_cast<void*>(&l1_test_resolve_marker));
  CHECK(marker.module.is_main);

  auto value = l1::h00k::resolve::find_export("l1_test_resolve_value", "");
  REQUIRE(value.error.ok());
  CHECK(value.address == static_cast<void*>(&l1_test_resolve_value));
}

TEST_CASE("l1h00k export table reports kinds and sizes") {
  auto main = l1::h00k::resolve::main_module();
  REQUIRE(main.has_value());

  auto exports = l1::h00k::resolve::enumerate_exports(*main);
  auto by_name = [&](const char* name) {
    return std::find_if(exports.begin(), exports.end(), [&](const auto& entry) { return entry.name == name; });
  };

  auto marker = by_name("l1_test_resolve_marker");
  REQUIRE(marker != exports.end());
  CHECK(marker->kind == l1::h00k::resolve::export_kind::function);

  auto value = by_name("l1_test_resolve_value");
  REQUIRE(value != exports.end());
  CHECK(value->kind == l1::h00k::resolve::export_kind::object);
  CHECK(value->size == sizeof(uint64_t));
}

TEST_CASE("l1h00k reports missing exports and modules") {
  auto missing_symbol = l1::h00k::resolve::find_export("l1_test_symbol_that_does_not_exist", nullptr);
  CHECK(missing_symbol.error.code == hook_error::not_found);
  CHECK(missing_symbol.address == nullptr);
  REQUIRE(missing_symbol.error.detail != nullptr);
  CHECK(std::string(missing_symbol.error.detail) == "symbol_not_found");

  auto missing_module = l1::h00k::resolve::find_export("malloc", "l1_no_such_module.so");
  CHECK(missing_module.error.code == hook_error::not_found);
  REQUIRE(missing_module.error.detail != nullptr);
  CHECK(std::string(missing_module.error.detail) == "module_not_found");

  auto empty = l1::h00k::resolve::find_export("", nullptr);
  CHECK(empty.error.code == hook_error::invalid_target);
}

TEST_CASE("l1h00k resolves symbols through the dynamic linker") {
  auto result = l1::h00k::resolve::resolve_symbol("malloc", nullptr);
  CHECK(result.error.ok());
  CHECK(result.address != nullptr);
  CHECK(l1::h00k::resolve::symbol_address("l1_test_resolve_marker", nullptr) ==
        reinterpret_cast<void*>(&l1_test_resolve_marker));
}
