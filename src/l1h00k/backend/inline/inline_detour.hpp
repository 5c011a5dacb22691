#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "l1base/arch_spec.hpp"

namespace l1::h00k::backend::inline_hook {

enum class detour_kind {
  none,
  rel32,
  absolute
};

struct detour_plan {
  l1::arch::mode arch = l1::arch::mode::unknown;
  detour_kind kind = detour_kind::none;
  // bytes overwritten at the target
  size_t min_patch = 0;
  // bytes of the jump appended after the relocated prologue
  size_t tail_size = 0;

  bool valid() const { return kind != detour_kind::none && min_patch > 0 && tail_size > 0; }
};

detour_plan plan_for(const l1::arch::arch_spec& spec, uint64_t from, uint64_t to);
bool build_detour_patch(
    const detour_plan& plan, uint64_t from, uint64_t to, size_t patch_size, std::vector<uint8_t>& out
);
bool append_trampoline_tail(const detour_plan& plan, uint64_t resume_addr, std::vector<uint8_t>& out);
bool prologue_safe(const detour_plan& plan, const uint8_t* bytes, size_t size);

} // namespace l1::h00k::backend::inline_hook
