#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "l1h00k/hook.hpp"

namespace l1::h00k::backend {

struct hook_plan {
  hook_request request{};
  void* resolved_target = nullptr;
  std::vector<uint8_t> patch_bytes{};
  std::vector<uint8_t> restore_bytes{};
  // entry point that runs the displaced instructions and resumes the target
  void* trampoline = nullptr;
  // executable allocation holding the trampoline
  void* block = nullptr;
  size_t block_size = 0;
};

struct prepare_result {
  hook_plan plan{};
  hook_error_info error{};
};

class hook_backend {
public:
  virtual ~hook_backend() = default;
  virtual bool supports(const hook_request& request) const = 0;
  virtual prepare_result prepare(const hook_request& request, void* resolved_target) = 0;
  virtual hook_error commit(const hook_plan& plan) = 0;
  virtual hook_error revert(const hook_plan& plan) = 0;
};

} // namespace l1::h00k::backend
