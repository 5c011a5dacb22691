#include "l1h00k/core/hook_manager.hpp"

#include <utility>

#include "l1h00k/backend/inline/inline_backend.hpp"
#include "l1h00k/memory/memory.hpp"
#include "l1h00k/resolve/resolve.hpp"

namespace l1::h00k::core {
namespace {

void free_trampoline(const backend::hook_plan& plan) {
  if (!plan.block || plan.block_size == 0) {
    return;
  }
  memory::free_executable({plan.block, plan.block_size});
}

hook_result failure(hook_error code, const char* detail = nullptr) {
  hook_result result{};
  result.error.code = code;
  result.error.detail = detail;
  return result;
}

} // namespace

hook_manager::hook_manager() : hook_manager(backend::make_inline_instrument_backend()) {}

hook_manager::hook_manager(std::unique_ptr<backend::hook_backend> backend) : backend_(std::move(backend)) {}

bool hook_manager::is_valid_target(const hook_target& target) const {
  switch (target.kind) {
  case hook_target_kind::address:
    return target.address != nullptr;
  case hook_target_kind::symbol:
    return target.symbol != nullptr && target.symbol[0] != '\0';
  }
  return false;
}

void* hook_manager::resolve_target(const hook_target& target) const {
  switch (target.kind) {
  case hook_target_kind::address:
    return target.address;
  case hook_target_kind::symbol:
    return resolve::symbol_address(target.symbol, target.module);
  }
  return nullptr;
}

void hook_manager::rollback_attach(const backend::hook_plan& plan) {
  (void) backend_->revert(plan);
  free_trampoline(plan);
}

hook_result hook_manager::attach(const hook_request& request, void** original) {
  std::lock_guard lock(mutex_);
  if (original) {
    *original = nullptr;
  }

  if (!is_valid_target(request.target)) {
    return failure(hook_error::invalid_target, "invalid_target");
  }
  if (!backend_ || !backend_->supports(request)) {
    return failure(hook_error::unsupported, "unsupported_request");
  }

  void* resolved = resolve_target(request.target);
  if (!resolved) {
    return failure(hook_error::not_found, "target_not_found");
  }
  if (target_to_handle_.find(resolved) != target_to_handle_.end()) {
    return failure(hook_error::already_hooked, "already_hooked");
  }

  auto prepared = backend_->prepare(request, resolved);
  if (!prepared.error.ok()) {
    return {{}, prepared.error};
  }

  const auto err = backend_->commit(prepared.plan);
  if (err != hook_error::ok) {
    rollback_attach(prepared.plan);
    return failure(err, "commit_failed");
  }

  installed_hook hook{};
  hook.handle = {next_id_++};
  hook.plan = std::move(prepared.plan);
  if (original) {
    *original = hook.plan.trampoline;
  }

  target_to_handle_[resolved] = hook.handle.id;
  const auto handle = hook.handle;
  hooks_.emplace(handle.id, std::move(hook));

  hook_result result{};
  result.handle = handle;
  result.error.code = hook_error::ok;
  return result;
}

hook_error hook_manager::detach(hook_handle handle) {
  std::lock_guard lock(mutex_);

  auto it = hooks_.find(handle.id);
  if (it == hooks_.end()) {
    return hook_error::not_found;
  }

  const auto err = backend_->revert(it->second.plan);
  if (err != hook_error::ok) {
    return err;
  }

  target_to_handle_.erase(it->second.plan.resolved_target);
  free_trampoline(it->second.plan);
  hooks_.erase(it);
  return hook_error::ok;
}

} // namespace l1::h00k::core
