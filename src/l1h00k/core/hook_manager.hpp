#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "l1h00k/backend/backend.hpp"
#include "l1h00k/hook.hpp"

namespace l1::h00k::core {

struct installed_hook {
  backend::hook_plan plan{};
  hook_handle handle{};
};

// owns every installed hook and serializes attach/detach
class hook_manager {
public:
  hook_manager();
  explicit hook_manager(std::unique_ptr<backend::hook_backend> backend);

  hook_result attach(const hook_request& request, void** original);
  hook_error detach(hook_handle handle);

private:
  bool is_valid_target(const hook_target& target) const;
  void* resolve_target(const hook_target& target) const;
  void rollback_attach(const backend::hook_plan& plan);

  mutable std::mutex mutex_{};
  std::unique_ptr<backend::hook_backend> backend_{};
  std::unordered_map<uintptr_t, installed_hook> hooks_{};
  std::unordered_map<void*, uintptr_t> target_to_handle_{};
  std::atomic<uintptr_t> next_id_{1};
};

} // namespace l1::h00k::core
