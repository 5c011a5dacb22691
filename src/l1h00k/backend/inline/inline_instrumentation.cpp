#include "l1h00k/backend/inline/inline_instrumentation.hpp"

#include <array>
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>

#include "l1asmr/asmr.hpp"
#include "l1h00k/core/hook_args.hpp"

namespace l1::h00k::backend::instrument {
namespace {

struct register_plan {
  const char* const* gpr = nullptr;
  size_t gpr_count = 0;
  const char* const* fpr = nullptr;
  size_t fpr_count = 0;
  size_t gpr_size = 8;
  size_t fpr_size = 16;
};

// argument registers first so the saved block doubles as the integer argument array
constexpr std::array<const char*, 9> kSysvGpr = {"rdi", "rsi", "rdx", "rcx", "r8", "r9", "rax", "r10", "r11"};
constexpr std::array<const char*, 8> kSysvFpr = {"xmm0", "xmm1", "xmm2", "xmm3", "xmm4", "xmm5", "xmm6", "xmm7"};
constexpr std::array<const char*, 20> kArm64Gpr = {"x0",  "x1",  "x2",  "x3",  "x4",  "x5",  "x6",
                                                   "x7",  "x8",  "x9",  "x10", "x11", "x12", "x13",
                                                   "x14", "x15", "x16", "x17", "x18", "x30"};
constexpr std::array<const char*, 8> kArm64Fpr = {"q0", "q1", "q2", "q3", "q4", "q5", "q6", "q7"};

constexpr size_t kStubReserve = 512;

struct field_offsets {
  size_t args_abi = offsetof(hook_arg_handle, abi);
  size_t args_reserved = offsetof(hook_arg_handle, reserved);
  size_t args_int = offsetof(hook_arg_handle, int_regs);
  size_t info_original = offsetof(hook_info, original_target);
  size_t info_target = offsetof(hook_info, target);
  size_t info_trampoline = offsetof(hook_info, trampoline);
  size_t info_user_data = offsetof(hook_info, user_data);
  size_t info_args = offsetof(hook_info, args);
};

size_t align_up(size_t value, size_t alignment) {
  if (alignment == 0) {
    return value;
  }
  const size_t mask = alignment - 1;
  return (value + mask) & ~mask;
}

std::string hex(uint64_t value) {
  std::ostringstream oss;
  oss << "0x" << std::hex << value;
  return oss.str();
}

bool plan_for(const l1::arch::arch_spec& arch, hook_call_abi abi, register_plan& plan) {
  switch (arch.arch_mode) {
  case l1::arch::mode::x86_64:
    if (abi != hook_call_abi::sysv) {
      return false;
    }
    plan.gpr = kSysvGpr.data();
    plan.gpr_count = kSysvGpr.size();
    plan.fpr = kSysvFpr.data();
    plan.fpr_count = kSysvFpr.size();
    return true;
  case l1::arch::mode::aarch64:
    if (abi != hook_call_abi::aapcs64) {
      return false;
    }
    plan.gpr = kArm64Gpr.data();
    plan.gpr_count = kArm64Gpr.size();
    plan.fpr = kArm64Fpr.data();
    plan.fpr_count = kArm64Fpr.size();
    return true;
  default:
    return false;
  }
}

bool assemble_stub(const l1::arch::arch_spec& arch, const std::string& text, uint64_t address,
                   std::vector<uint8_t>& out) {
  auto ctx = l1::asmr::context::for_mode(arch.arch_mode);
  if (!ctx.ok()) {
    return false;
  }
  auto bytes = ctx.value.assemble(text, address);
  if (!bytes.ok()) {
    return false;
  }
  out = std::move(bytes.value);
  return true;
}

void append_mov_imm64(std::ostringstream& oss, const char* reg, uint64_t value) {
  oss << "movz " << reg << ", #" << hex(value & 0xFFFFu) << "\n";
  for (unsigned shift = 16; shift < 64; shift += 16) {
    oss << "movk " << reg << ", #" << hex((value >> shift) & 0xFFFFu) << ", lsl #" << shift << "\n";
  }
}

bool build_x86_64_stub(const stub_request& request, const stub_layout& layout, const register_plan& plan,
                       std::vector<uint8_t>& out) {
  const field_offsets off{};
  std::ostringstream oss;

  oss << "sub rsp, " << layout.stack_size << "\n";
  for (size_t i = 0; i < plan.gpr_count; ++i) {
    oss << "mov qword ptr [rsp + " << (layout.gpr_offset + i * plan.gpr_size) << "], " << plan.gpr[i] << "\n";
  }
  for (size_t i = 0; i < plan.fpr_count; ++i) {
    oss << "movdqu xmmword ptr [rsp + " << (layout.fpr_offset + i * plan.fpr_size) << "], " << plan.fpr[i] << "\n";
  }

  const size_t args = layout.args_offset;
  const size_t info = layout.info_offset;
  oss << "mov dword ptr [rsp + " << (args + off.args_abi) << "], " << static_cast<uint32_t>(request.abi) << "\n";
  oss << "mov dword ptr [rsp + " << (args + off.args_reserved) << "], 0\n";
  oss << "lea rax, [rsp + " << layout.gpr_offset << "]\n";
  oss << "mov qword ptr [rsp + " << (args + off.args_int) << "], rax\n";

  oss << "lea rax, [rsp + " << args << "]\n";
  oss << "mov qword ptr [rsp + " << (info + off.info_args) << "], rax\n";
  oss << "mov rax, " << hex(request.target) << "\n";
  oss << "mov qword ptr [rsp + " << (info + off.info_original) << "], rax\n";
  oss << "mov qword ptr [rsp + " << (info + off.info_target) << "], rax\n";
  oss << "mov rax, " << hex(request.trampoline) << "\n";
  oss << "mov qword ptr [rsp + " << (info + off.info_trampoline) << "], rax\n";
  oss << "mov rax, " << hex(request.user_data) << "\n";
  oss << "mov qword ptr [rsp + " << (info + off.info_user_data) << "], rax\n";

  oss << "lea rdi, [rsp + " << info << "]\n";
  oss << "mov rax, " << hex(request.prehook) << "\n";
  oss << "call rax\n";

  for (size_t i = 0; i < plan.fpr_count; ++i) {
    oss << "movdqu " << plan.fpr[i] << ", xmmword ptr [rsp + " << (layout.fpr_offset + i * plan.fpr_size) << "]\n";
  }
  for (size_t i = 0; i < plan.gpr_count; ++i) {
    oss << "mov " << plan.gpr[i] << ", qword ptr [rsp + " << (layout.gpr_offset + i * plan.gpr_size) << "]\n";
  }
  oss << "add rsp, " << layout.stack_size << "\n";
  oss << "jmp " << hex(request.trampoline) << "\n";

  return assemble_stub(request.arch, oss.str(), request.stub_address, out);
}

void emit_arm64_pairs(std::ostringstream& oss, const char* op_pair, const char* op_single, const char* const* regs,
                      size_t count, size_t base, size_t size) {
  size_t offset = base;
  size_t i = 0;
  for (; i + 1 < count; i += 2) {
    oss << op_pair << " " << regs[i] << ", " << regs[i + 1] << ", [sp, #" << offset << "]\n";
    offset += size * 2;
  }
  if (i < count) {
    oss << op_single << " " << regs[i] << ", [sp, #" << offset << "]\n";
  }
}

bool build_arm64_stub(const stub_request& request, const stub_layout& layout, const register_plan& plan,
                      std::vector<uint8_t>& out) {
  const field_offsets off{};
  std::ostringstream oss;

  oss << "sub sp, sp, #" << layout.stack_size << "\n";
  emit_arm64_pairs(oss, "stp", "str", plan.gpr, plan.gpr_count, layout.gpr_offset, plan.gpr_size);
  emit_arm64_pairs(oss, "stp", "str", plan.fpr, plan.fpr_count, layout.fpr_offset, plan.fpr_size);

  const size_t args = layout.args_offset;
  const size_t info = layout.info_offset;
  oss << "mov w16, #" << static_cast<uint32_t>(request.abi) << "\n";
  oss << "str w16, [sp, #" << (args + off.args_abi) << "]\n";
  oss << "str wzr, [sp, #" << (args + off.args_reserved) << "]\n";
  oss << "add x16, sp, #" << layout.gpr_offset << "\n";
  oss << "str x16, [sp, #" << (args + off.args_int) << "]\n";

  oss << "add x16, sp, #" << args << "\n";
  oss << "str x16, [sp, #" << (info + off.info_args) << "]\n";
  append_mov_imm64(oss, "x16", request.target);
  oss << "str x16, [sp, #" << (info + off.info_original) << "]\n";
  oss << "str x16, [sp, #" << (info + off.info_target) << "]\n";
  append_mov_imm64(oss, "x16", request.trampoline);
  oss << "str x16, [sp, #" << (info + off.info_trampoline) << "]\n";
  append_mov_imm64(oss, "x16", request.user_data);
  oss << "str x16, [sp, #" << (info + off.info_user_data) << "]\n";

  oss << "add x0, sp, #" << info << "\n";
  append_mov_imm64(oss, "x16", request.prehook);
  oss << "blr x16\n";

  emit_arm64_pairs(oss, "ldp", "ldr", plan.fpr, plan.fpr_count, layout.fpr_offset, plan.fpr_size);
  emit_arm64_pairs(oss, "ldp", "ldr", plan.gpr, plan.gpr_count, layout.gpr_offset, plan.gpr_size);
  oss << "add sp, sp, #" << layout.stack_size << "\n";
  oss << "b " << hex(request.trampoline) << "\n";

  return assemble_stub(request.arch, oss.str(), request.stub_address, out);
}

} // namespace

hook_call_abi resolve_call_abi(hook_call_abi requested, const l1::arch::arch_spec& arch) {
  if (requested != hook_call_abi::native) {
    return requested;
  }
  switch (arch.arch_mode) {
  case l1::arch::mode::aarch64:
    return hook_call_abi::aapcs64;
  case l1::arch::mode::x86_64:
    return hook_call_abi::sysv;
  default:
    return hook_call_abi::native;
  }
}

bool abi_supported(hook_call_abi abi, const l1::arch::arch_spec& arch) {
  register_plan plan{};
  return plan_for(arch, abi, plan);
}

bool make_layout(const l1::arch::arch_spec& arch, hook_call_abi abi, stub_layout& out) {
  register_plan plan{};
  if (!plan_for(arch, abi, plan)) {
    return false;
  }

  stub_layout layout{};
  size_t offset = 0;
  layout.gpr_offset = offset;
  layout.gpr_count = plan.gpr_count;
  offset += plan.gpr_count * plan.gpr_size;

  offset = align_up(offset, plan.fpr_size);
  layout.fpr_offset = offset;
  layout.fpr_count = plan.fpr_count;
  offset += plan.fpr_count * plan.fpr_size;

  offset = align_up(offset, alignof(hook_arg_handle));
  layout.args_offset = offset;
  offset += sizeof(hook_arg_handle);

  offset = align_up(offset, alignof(hook_info));
  layout.info_offset = offset;
  offset += sizeof(hook_info);

  layout.stack_size = align_up(offset, 16);
  if (arch.arch_mode == l1::arch::mode::x86_64) {
    // entry rsp is 8 mod 16; the prehook call needs it 16-byte aligned
    layout.stack_size += 8;
  }
  out = layout;
  return true;
}

size_t stub_reserve_size() { return kStubReserve; }

bool build_stub(const stub_request& request, const stub_layout& layout, std::vector<uint8_t>& out) {
  register_plan plan{};
  if (!plan_for(request.arch, request.abi, plan)) {
    return false;
  }

  switch (request.arch.arch_mode) {
  case l1::arch::mode::x86_64:
    return build_x86_64_stub(request, layout, plan, out);
  case l1::arch::mode::aarch64:
    return build_arm64_stub(request, layout, plan, out);
  default:
    return false;
  }
}

} // namespace l1::h00k::backend::instrument
