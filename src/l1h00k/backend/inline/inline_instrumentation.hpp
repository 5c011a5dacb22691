#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "l1base/arch_spec.hpp"
#include "l1h00k/hook.hpp"

namespace l1::h00k::backend::instrument {

// stack frame built by the stub; offsets are relative to the stack pointer after allocation
struct stub_layout {
  size_t stack_size = 0;
  size_t gpr_offset = 0;
  size_t fpr_offset = 0;
  size_t args_offset = 0;
  size_t info_offset = 0;
  size_t gpr_count = 0;
  size_t fpr_count = 0;
};

struct stub_request {
  l1::arch::arch_spec arch{};
  hook_call_abi abi = hook_call_abi::native;
  uintptr_t target = 0;
  uintptr_t trampoline = 0;
  uintptr_t prehook = 0;
  uintptr_t user_data = 0;
  uintptr_t stub_address = 0;
};

hook_call_abi resolve_call_abi(hook_call_abi requested, const l1::arch::arch_spec& arch);
bool abi_supported(hook_call_abi abi, const l1::arch::arch_spec& arch);
bool make_layout(const l1::arch::arch_spec& arch, hook_call_abi abi, stub_layout& out);
size_t stub_reserve_size();
bool build_stub(const stub_request& request, const stub_layout& layout, std::vector<uint8_t>& out);

} // namespace l1::h00k::backend::instrument
