#include "l1h00k/backend/inline/inline_backend.hpp"

#include <cstring>

#include "l1base/arch_spec.hpp"
#include "l1h00k/backend/inline/inline_detour.hpp"
#include "l1h00k/backend/inline/inline_instrumentation.hpp"
#include "l1h00k/memory/memory.hpp"
#include "l1h00k/patcher/patcher.hpp"
#include "l1h00k/reloc/relocator.hpp"

namespace l1::h00k::backend {
namespace {

size_t max_patch_for(const l1::arch::arch_spec& arch) {
  switch (arch.arch_mode) {
  case l1::arch::mode::x86_64:
    return 14;
  case l1::arch::mode::aarch64:
    return 16;
  default:
    return 0;
  }
}

prepare_result fail(hook_error code, const char* detail, int os_error = 0) {
  prepare_result result{};
  result.error.code = code;
  result.error.detail = detail;
  result.error.os_error = os_error;
  return result;
}

} // namespace

// block layout: [instrumentation stub][relocated prologue][jump back into the target]
class inline_instrument_backend final : public hook_backend {
public:
  bool supports(const hook_request& request) const override {
    if (request.prehook == nullptr) {
      return false;
    }
    const auto arch = l1::arch::detect_host_arch_spec();
    return instrument::abi_supported(instrument::resolve_call_abi(request.call_abi, arch), arch);
  }

  prepare_result prepare(const hook_request& request, void* resolved_target) override {
    if (!supports(request)) {
      return fail(hook_error::unsupported, "unsupported_request");
    }
    if (resolved_target == nullptr) {
      return fail(hook_error::not_found, "target_not_found");
    }

    const auto arch = l1::arch::detect_host_arch_spec();
    const auto abi = instrument::resolve_call_abi(request.call_abi, arch);
    const auto target = reinterpret_cast<uint64_t>(resolved_target);

    instrument::stub_layout layout{};
    if (!instrument::make_layout(arch, abi, layout)) {
      return fail(hook_error::unsupported, "stub_layout");
    }

    const size_t stub_size = instrument::stub_reserve_size();
    const size_t reloc_size = reloc::max_trampoline_size(max_patch_for(arch), arch);
    if (reloc_size == 0) {
      return fail(hook_error::unsupported, "unsupported_arch");
    }

    const size_t tail_reserve = 16;
    auto block = memory::allocate_trampoline(resolved_target, stub_size + reloc_size + tail_reserve, arch);
    if (!block.ok()) {
      return fail(hook_error::near_alloc_failed, "trampoline_alloc");
    }

    const auto stub_addr = reinterpret_cast<uint64_t>(block.address);
    const uint64_t tramp_addr = stub_addr + stub_size;

    const auto plan = inline_hook::plan_for(arch, target, stub_addr);
    if (!plan.valid()) {
      memory::free_executable(block);
      return fail(hook_error::unsupported, "detour_plan");
    }

    auto relocated = reloc::relocate(resolved_target, plan.min_patch, tramp_addr, arch);
    if (!relocated.ok()) {
      memory::free_executable(block);
      return fail(hook_error::relocation_failed, reloc::to_string(relocated.error));
    }

    const auto* original_bytes = static_cast<const uint8_t*>(resolved_target);
    if (!inline_hook::prologue_safe(plan, original_bytes, relocated.patch_size)) {
      memory::free_executable(block);
      return fail(hook_error::relocation_failed, "prologue_crosses_return");
    }

    std::vector<uint8_t> trampoline_bytes = std::move(relocated.trampoline_bytes);
    if (!inline_hook::append_trampoline_tail(plan, target + relocated.patch_size, trampoline_bytes) ||
        trampoline_bytes.size() > reloc_size + tail_reserve) {
      memory::free_executable(block);
      return fail(hook_error::relocation_failed, "trampoline_tail");
    }

    instrument::stub_request stub_req{};
    stub_req.arch = arch;
    stub_req.abi = abi;
    stub_req.target = target;
    stub_req.trampoline = tramp_addr;
    stub_req.prehook = reinterpret_cast<uintptr_t>(request.prehook);
    stub_req.user_data = reinterpret_cast<uintptr_t>(request.user_data);
    stub_req.stub_address = stub_addr;

    std::vector<uint8_t> stub_bytes;
    if (!instrument::build_stub(stub_req, layout, stub_bytes) || stub_bytes.size() > stub_size) {
      memory::free_executable(block);
      return fail(hook_error::unsupported, "stub_assembly");
    }

    code_patcher patcher;
    if (!patcher.write(block.address, stub_bytes.data(), stub_bytes.size()) ||
        !patcher.write(reinterpret_cast<void*>(tramp_addr), trampoline_bytes.data(), trampoline_bytes.size())) {
      const int os_error = patcher.last_os_error();
      memory::free_executable(block);
      return fail(hook_error::patch_failed, "trampoline_write", os_error);
    }

    std::vector<uint8_t> patch_bytes;
    if (!inline_hook::build_detour_patch(plan, target, stub_addr, relocated.patch_size, patch_bytes)) {
      memory::free_executable(block);
      return fail(hook_error::patch_failed, "detour_patch");
    }

    std::vector<uint8_t> restore_bytes(relocated.patch_size);
    std::memcpy(restore_bytes.data(), resolved_target, restore_bytes.size());

    prepare_result result{};
    result.plan.request = request;
    result.plan.resolved_target = resolved_target;
    result.plan.patch_bytes = std::move(patch_bytes);
    result.plan.restore_bytes = std::move(restore_bytes);
    result.plan.trampoline = reinterpret_cast<void*>(tramp_addr);
    result.plan.block = block.address;
    result.plan.block_size = block.size;
    result.error.code = hook_error::ok;
    return result;
  }

  hook_error commit(const hook_plan& plan) override {
    if (!plan.resolved_target || plan.patch_bytes.empty()) {
      return hook_error::invalid_target;
    }
    code_patcher patcher;
    if (!patcher.write(plan.resolved_target, plan.patch_bytes.data(), plan.patch_bytes.size())) {
      return hook_error::patch_failed;
    }
    return hook_error::ok;
  }

  hook_error revert(const hook_plan& plan) override {
    if (!plan.resolved_target || plan.restore_bytes.empty()) {
      return hook_error::invalid_target;
    }
    code_patcher patcher;
    if (!patcher.restore(plan.resolved_target, plan.restore_bytes.data(), plan.restore_bytes.size())) {
      return hook_error::patch_failed;
    }
    return hook_error::ok;
  }
};

std::unique_ptr<hook_backend> make_inline_instrument_backend() {
  return std::make_unique<inline_instrument_backend>();
}

} // namespace l1::h00k::backend
