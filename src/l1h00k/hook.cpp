#include "l1h00k/hook.hpp"

#include "l1h00k/core/hook_args.hpp"
#include "l1h00k/core/hook_manager.hpp"

namespace l1::h00k {
namespace {

struct abi_layout {
  size_t int_reg_count = 0;
  size_t int_stride = 0;
};

hook_call_abi resolve_native_abi() {
#if defined(__aarch64__)
  return hook_call_abi::aapcs64;
#else
  return hook_call_abi::sysv;
#endif
}

bool layout_for(hook_call_abi abi, abi_layout& out) {
  if (sizeof(void*) != 8) {
    return false;
  }
  out.int_stride = 8;

  switch (abi) {
  case hook_call_abi::sysv:
    out.int_reg_count = 6;
    return true;
  case hook_call_abi::aapcs64:
    out.int_reg_count = 8;
    return true;
  case hook_call_abi::native:
    return layout_for(resolve_native_abi(), out);
  }
  return false;
}

core::hook_manager& global_manager() {
  static core::hook_manager manager{};
  return manager;
}

} // namespace

const char* to_string(hook_error error) {
  switch (error) {
  case hook_error::ok:
    return "ok";
  case hook_error::unsupported:
    return "unsupported";
  case hook_error::invalid_target:
    return "invalid_target";
  case hook_error::relocation_failed:
    return "relocation_failed";
  case hook_error::near_alloc_failed:
    return "near_alloc_failed";
  case hook_error::patch_failed:
    return "patch_failed";
  case hook_error::already_hooked:
    return "already_hooked";
  case hook_error::not_found:
    return "not_found";
  case hook_error::access_denied:
    return "access_denied";
  }
  return "unknown";
}

hook_result attach(const hook_request& request, void** original) { return global_manager().attach(request, original); }

hook_error detach(hook_handle handle) { return global_manager().detach(handle); }

void* arg_get_int_reg_addr(const hook_arg_handle* args, int pos) {
  if (!args || pos < 0 || !args->int_regs) {
    return nullptr;
  }

  abi_layout layout{};
  if (!layout_for(args->abi, layout)) {
    return nullptr;
  }

  if (static_cast<size_t>(pos) >= layout.int_reg_count) {
    return nullptr;
  }

  auto* base = static_cast<uint8_t*>(const_cast<void*>(args->int_regs));
  return base + (static_cast<size_t>(pos) * layout.int_stride);
}

} // namespace l1::h00k
