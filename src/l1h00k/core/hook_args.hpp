#pragma once

#include <cstdint>
#include <type_traits>

#include "l1h00k/hook.hpp"

namespace l1::h00k {

// laid out by the instrumentation stub on its own stack frame.
// floating point registers are saved and restored by the stub but not exposed.
struct hook_arg_handle {
  hook_call_abi abi = hook_call_abi::native;
  uint32_t reserved = 0;
  const void* int_regs = nullptr;
};

static_assert(std::is_standard_layout_v<hook_arg_handle>);
static_assert(std::is_trivially_copyable_v<hook_arg_handle>);

} // namespace l1::h00k
