#include <doctest/doctest.h>

#include <cstdint>
#include <cstring>

#include "l1h00k/memory/memory.hpp"
#include "l1h00k/patcher/patcher.hpp"

TEST_CASE("l1h00k allocates executable blocks near a target") {
  static int anchor = 0;
  constexpr size_t kRange = 0x7FFF0000;

  auto block = l1::h00k::memory::allocate_near(&anchor, 256, kRange);
  if (!block.ok()) {
    // address space around the anchor may be exhausted
    WARN(block.ok());
    return;
  }

  const auto anchor_addr = reinterpret_cast<uintptr_t>(&anchor);
  const auto block_addr = reinterpret_cast<uintptr_t>(block.address);
  const uintptr_t distance = block_addr > anchor_addr ? block_addr - anchor_addr : anchor_addr - block_addr;
  CHECK(distance <= kRange);
  CHECK(block.size >= 256);

  l1::h00k::memory::free_executable(block);
}

TEST_CASE("l1h00k patcher writes and restores executable memory") {
  auto block = l1::h00k::memory::allocate_executable(64);
  REQUIRE(block.ok());

  auto* bytes = static_cast<uint8_t*>(block.address);
  const uint8_t original[4] = {bytes[0], bytes[1], bytes[2], bytes[3]};
  const uint8_t patch[4] = {0xDE, 0xAD, 0xBE, 0xEF};

  l1::h00k::code_patcher patcher;
  REQUIRE(patcher.write(block.address, patch, sizeof(patch)));
  CHECK(std::memcmp(bytes, patch, sizeof(patch)) == 0);

  REQUIRE(patcher.restore(block.address, original, sizeof(original)));
  CHECK(std::memcmp(bytes, original, sizeof(original)) == 0);

  l1::h00k::memory::free_executable(block);
}

TEST_CASE("l1h00k patcher rejects empty writes") {
  l1::h00k::code_patcher patcher;
  const uint8_t byte = 0x90;
  CHECK_FALSE(patcher.write(nullptr, &byte, 1));
}
