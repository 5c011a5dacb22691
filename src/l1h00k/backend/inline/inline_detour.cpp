#include "l1h00k/backend/inline/inline_detour.hpp"

#include <cstring>

#include "l1h00k/reloc/common.hpp"

namespace l1::h00k::backend::inline_hook {
namespace {

using reloc::detail::append_u32;
using reloc::detail::append_u64;

constexpr uint32_t kArm64Ret = 0xD65F03C0u;
constexpr uint32_t kArm64Nop = 0xD503201Fu;

bool fits_rel32(uint64_t from, uint64_t to) {
  const int64_t disp = static_cast<int64_t>(to - (from + 5));
  return reloc::detail::fits_signed(disp, 32);
}

void emit_x86_rel32_jump(std::vector<uint8_t>& out, uint64_t from, uint64_t to) {
  out.push_back(0xE9);
  append_u32(out, static_cast<uint32_t>(static_cast<int32_t>(static_cast<int64_t>(to - (from + 5)))));
}

void emit_x86_abs_jump(std::vector<uint8_t>& out, uint64_t to) {
  out.insert(out.end(), {0xFF, 0x25, 0x00, 0x00, 0x00, 0x00});
  append_u64(out, to);
}

// ldr x16, #8; br x16; .quad to
void emit_arm64_abs_jump(std::vector<uint8_t>& out, uint64_t to) {
  append_u32(out, 0x58000050u);
  append_u32(out, 0xD61F0200u);
  append_u64(out, to);
}

// an early return inside the overwritten range means the detour would clobber the next function
bool arm64_patch_crosses_return(const uint8_t* bytes, size_t size) {
  bool after_ret = false;
  for (size_t offset = 0; offset + 4 <= size; offset += 4) {
    uint32_t inst = 0;
    std::memcpy(&inst, bytes + offset, sizeof(inst));
    if (after_ret && inst != kArm64Nop) {
      return true;
    }
    if (inst == kArm64Ret) {
      after_ret = true;
    }
  }
  return false;
}

} // namespace

detour_plan plan_for(const l1::arch::arch_spec& spec, uint64_t from, uint64_t to) {
  detour_plan plan{};
  plan.arch = spec.arch_mode;
  switch (spec.arch_mode) {
  case l1::arch::mode::x86_64:
    if (fits_rel32(from, to)) {
      plan.kind = detour_kind::rel32;
      plan.min_patch = 5;
    } else {
      plan.kind = detour_kind::absolute;
      plan.min_patch = 14;
    }
    plan.tail_size = 14;
    break;
  case l1::arch::mode::aarch64:
    plan.kind = detour_kind::absolute;
    plan.min_patch = 16;
    plan.tail_size = 16;
    break;
  default:
    break;
  }
  return plan;
}

bool build_detour_patch(
    const detour_plan& plan, uint64_t from, uint64_t to, size_t patch_size, std::vector<uint8_t>& out
) {
  out.clear();
  switch (plan.arch) {
  case l1::arch::mode::x86_64:
    if (plan.kind == detour_kind::rel32) {
      if (!fits_rel32(from, to)) {
        return false;
      }
      emit_x86_rel32_jump(out, from, to);
    } else {
      emit_x86_abs_jump(out, to);
    }
    // int3 padding; the tail of a split instruction is never executed
    out.resize(patch_size < out.size() ? out.size() : patch_size, 0xCC);
    break;
  case l1::arch::mode::aarch64:
    emit_arm64_abs_jump(out, to);
    while (out.size() < patch_size) {
      append_u32(out, kArm64Nop);
    }
    break;
  default:
    return false;
  }
  return out.size() == patch_size;
}

bool append_trampoline_tail(const detour_plan& plan, uint64_t resume_addr, std::vector<uint8_t>& out) {
  switch (plan.arch) {
  case l1::arch::mode::x86_64:
    emit_x86_abs_jump(out, resume_addr);
    return true;
  case l1::arch::mode::aarch64:
    emit_arm64_abs_jump(out, resume_addr);
    return true;
  default:
    return false;
  }
}

bool prologue_safe(const detour_plan& plan, const uint8_t* bytes, size_t size) {
  if (!bytes) {
    return false;
  }
  if (plan.arch == l1::arch::mode::aarch64) {
    return !arm64_patch_crosses_return(bytes, size);
  }
  return true;
}

} // namespace l1::h00k::backend::inline_hook
