#include <doctest/doctest.h>

#include <cstdint>
#include <vector>

#include "l1asmr/asmr.hpp"

using l1::asmr::context;
using l1::asmr::error_code;
using l1::arch::mode;

TEST_CASE("l1asmr assembles and disassembles x86_64") {
  auto ctx = context::for_mode(mode::x86_64);
  REQUIRE(ctx.ok());
  CHECK(ctx.value.architecture() == mode::x86_64);

  auto bytes = ctx.value.assemble("mov eax, 1; ret", 0x1000);
  REQUIRE(bytes.ok());
  CHECK(bytes.value.size() >= 2);

  auto disasm = ctx.value.disassemble(bytes.value, 0x1000);
  REQUIRE(disasm.ok());
  REQUIRE(disasm.value.size() == 2);
  CHECK(disasm.value.front().mnemonic == "mov");
  CHECK(disasm.value.front().address == 0x1000);
  CHECK(disasm.value.back().mnemonic == "ret");
}

TEST_CASE("l1asmr reports x86_64 rip-relative operands") {
  auto ctx = context::for_mode(mode::x86_64);
  REQUIRE(ctx.ok());

  const std::vector<uint8_t> mov = {0x8B, 0x05, 0x10, 0x00, 0x00, 0x00}; // mov eax, [rip+0x10]
  auto disasm = ctx.value.disassemble(mov, 0x4000);
  REQUIRE(disasm.ok());
  REQUIRE(disasm.value.size() == 1);

  const auto& insn = disasm.value.front();
  CHECK(insn.is_pc_relative);
  CHECK(insn.encoding_info.disp_size == 4);
  CHECK(insn.encoding_info.disp_offset == 2);
}

TEST_CASE("l1asmr flags relative branches") {
  auto ctx = context::for_mode(mode::x86_64);
  REQUIRE(ctx.ok());

  const std::vector<uint8_t> jmp = {0xE9, 0x00, 0x01, 0x00, 0x00};
  auto disasm = ctx.value.disassemble(jmp, 0x2000);
  REQUIRE(disasm.ok());
  REQUIRE(disasm.value.size() == 1);
  CHECK(disasm.value.front().is_branch_relative);
  CHECK_FALSE(disasm.value.front().is_pc_relative);
}

TEST_CASE("l1asmr limits decoded instruction count") {
  auto ctx = context::for_mode(mode::x86_64);
  REQUIRE(ctx.ok());

  const std::vector<uint8_t> nops = {0x90, 0x90, 0x90, 0x90};
  auto disasm = ctx.value.disassemble(nops, 0x3000, 2);
  REQUIRE(disasm.ok());
  CHECK(disasm.value.size() == 2);
}

TEST_CASE("l1asmr assembles arm64") {
  auto ctx = context::for_mode(mode::aarch64);
  REQUIRE(ctx.ok());

  auto bytes = ctx.value.assemble("ret", 0x1000);
  REQUIRE(bytes.ok());
  REQUIRE(bytes.value.size() == 4);
  CHECK(bytes.value[0] == 0xC0);
  CHECK(bytes.value[3] == 0xD6);
}

TEST_CASE("l1asmr rejects empty input and unknown modes") {
  auto ctx = context::for_host();
  REQUIRE(ctx.ok());

  auto empty = ctx.value.assemble("", 0);
  CHECK_FALSE(empty.ok());
  CHECK(empty.status_info.code == error_code::invalid_argument);

  auto unknown = context::for_mode(mode::unknown);
  CHECK_FALSE(unknown.ok());
  CHECK(unknown.status_info.code == error_code::unsupported);
}
