#include <doctest/doctest.h>

#include <cstdint>
#include <cstring>

#include "l1h00k/hook.hpp"

namespace {

#define L1_NO_INLINE __attribute__((noinline))

volatile uint64_t g_sink_base = 0;
volatile uint64_t g_sink_size = 0;
volatile int g_sink_calls = 0;

L1_NO_INLINE uint64_t record_mapping(uint64_t base, uint64_t size) {
  g_sink_base = base;
  g_sink_size = size;
  g_sink_calls = g_sink_calls + 1;
  return base + size;
}

struct capture_state {
  int calls = 0;
  uint64_t arg0 = 0;
  uint64_t arg1 = 0;
  void* user_data = nullptr;
  void* target = nullptr;
  void* trampoline = nullptr;
};

capture_state g_capture{};

uint64_t read_u64_arg(const void* addr) {
  uint64_t value = 0;
  if (addr) {
    std::memcpy(&value, addr, sizeof(value));
  }
  return value;
}

void prehook(l1::h00k::hook_info* info) {
  g_capture.calls += 1;
  g_capture.arg0 = read_u64_arg(l1::h00k::arg_get_int_reg_addr(info->args, 0));
  g_capture.arg1 = read_u64_arg(l1::h00k::arg_get_int_reg_addr(info->args, 1));
  g_capture.user_data = info->user_data;
  g_capture.target = info->target;
  g_capture.trampoline = info->trampoline;
}

// calls through a volatile pointer so the compiler cannot fold the call away
uint64_t call_record_mapping(uint64_t base, uint64_t size) {
  uint64_t (*volatile fn)(uint64_t, uint64_t) = &record_mapping;
  return fn(base, size);
}

l1::h00k::hook_request make_request(void* user_data) {
  l1::h00k::hook_request request{};
  request.target.kind = l1::h00k::hook_target_kind::address;
  request.target.address = reinterpret_cast<void*>(&record_mapping);
  request.prehook = &prehook;
  request.user_data = user_data;
  return request;
}

} // namespace

TEST_CASE("l1h00k instrumentation prehook sees integer arguments") {
  g_capture = {};
  int marker = 0;

  void* original = nullptr;
  auto result = l1::h00k::attach(make_request(&marker), &original);
  REQUIRE(result.error.ok());
  REQUIRE(result.handle.valid());
  CHECK(original != nullptr);

  const uint64_t value = call_record_mapping(0x7f0000001000ULL, 0x2000);
  CHECK(value == 0x7f0000003000ULL);
  CHECK(g_sink_base == 0x7f0000001000ULL);

  CHECK(g_capture.calls == 1);
  CHECK(g_capture.arg0 == 0x7f0000001000ULL);
  CHECK(g_capture.arg1 == 0x2000);
  CHECK(g_capture.user_data == &marker);
  CHECK(g_capture.target == reinterpret_cast<void*>(&record_mapping));
  CHECK(g_capture.trampoline == original);

  // the trampoline runs the original body without re-entering the prehook
  auto* trampoline = reinterpret_cast<uint64_t (*)(uint64_t, uint64_t)>(original);
  CHECK(trampoline(0x10, 0x20) == 0x30);
  CHECK(g_capture.calls == 1);

  CHECK(l1::h00k::detach(result.handle) == l1::h00k::hook_error::ok);

  call_record_mapping(1, 2);
  CHECK(g_capture.calls == 1);
  CHECK(g_sink_base == 1);
}

TEST_CASE("l1h00k refuses to hook a target twice") {
  g_capture = {};

  auto first = l1::h00k::attach(make_request(nullptr), nullptr);
  REQUIRE(first.error.ok());

  auto second = l1::h00k::attach(make_request(nullptr), nullptr);
  CHECK(second.error.code == l1::h00k::hook_error::already_hooked);
  CHECK_FALSE(second.handle.valid());

  call_record_mapping(3, 4);
  CHECK(g_capture.calls == 1);

  CHECK(l1::h00k::detach(first.handle) == l1::h00k::hook_error::ok);
  CHECK(l1::h00k::detach(first.handle) == l1::h00k::hook_error::not_found);
}

TEST_CASE("l1h00k rejects requests without a target or prehook") {
  l1::h00k::hook_request empty{};
  empty.prehook = &prehook;
  auto no_target = l1::h00k::attach(empty, nullptr);
  CHECK(no_target.error.code == l1::h00k::hook_error::invalid_target);

  auto request = make_request(nullptr);
  request.prehook = nullptr;
  auto no_prehook = l1::h00k::attach(request, nullptr);
  CHECK(no_prehook.error.code == l1::h00k::hook_error::unsupported);

  l1::h00k::hook_request missing{};
  missing.target.kind = l1::h00k::hook_target_kind::symbol;
  missing.target.symbol = "l1_test_symbol_that_does_not_exist";
  missing.prehook = &prehook;
  auto not_found = l1::h00k::attach(missing, nullptr);
  CHECK(not_found.error.code == l1::h00k::hook_error::not_found);
}
