#pragma once

#include <cstddef>
#include <cstdint>

namespace l1::h00k {

enum class hook_target_kind {
  address,
  symbol
};

enum class hook_call_abi {
  native,
  sysv,
  aapcs64
};

enum class hook_error {
  ok,
  unsupported,
  invalid_target,
  relocation_failed,
  near_alloc_failed,
  patch_failed,
  already_hooked,
  not_found,
  access_denied
};

const char* to_string(hook_error error);

struct hook_target {
  hook_target_kind kind = hook_target_kind::address;
  void* address = nullptr;
  const char* symbol = nullptr;
  // null or empty selects the main executable
  const char* module = nullptr;
};

struct hook_arg_handle;

// filled in by the instrumentation stub on every call to the target
struct hook_info {
  void* original_target = nullptr;
  void* target = nullptr;
  void* trampoline = nullptr;
  void* user_data = nullptr;
  hook_arg_handle* args = nullptr;
};

using prehook_fn = void (*)(hook_info*);

// an instrument request: prehook runs on entry, then the original body runs unchanged
struct hook_request {
  hook_target target{};
  hook_call_abi call_abi = hook_call_abi::native;
  prehook_fn prehook = nullptr;
  void* user_data = nullptr;
};

struct hook_handle {
  uintptr_t id = 0;

  constexpr bool valid() const { return id != 0; }
};

struct hook_error_info {
  hook_error code = hook_error::unsupported;
  int os_error = 0;
  const char* detail = nullptr;

  constexpr bool ok() const { return code == hook_error::ok; }
};

struct hook_result {
  hook_handle handle{};
  hook_error_info error{};
};

// original receives the trampoline that runs the relocated prologue
hook_result attach(const hook_request& request, void** original);
hook_error detach(hook_handle handle);

void* arg_get_int_reg_addr(const hook_arg_handle* args, int pos);

} // namespace l1::h00k
