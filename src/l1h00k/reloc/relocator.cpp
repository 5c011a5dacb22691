#include "l1h00k/reloc/relocator.hpp"

#include "l1asmr/asmr.hpp"
#include "l1h00k/reloc/arm64.hpp"
#include "l1h00k/reloc/common.hpp"
#include "l1h00k/reloc/x86.hpp"

namespace l1::h00k::reloc {

reloc_result relocate(
    const void* target, size_t min_patch_size, uint64_t trampoline_address, const l1::arch::arch_spec& arch
) {
  auto fail = [](reloc_error error) {
    reloc_result out{};
    out.error = error;
    return out;
  };

  if (!target) {
    return fail(reloc_error::invalid_target);
  }
  if (min_patch_size == 0 || min_patch_size > detail::kMaxPatchBytes) {
    return fail(reloc_error::invalid_request);
  }

  auto disasm = l1::asmr::context::for_mode(arch.arch_mode);
  if (!disasm.ok()) {
    if (disasm.status_info.code == l1::asmr::error_code::unsupported) {
      return fail(reloc_error::unsupported_arch);
    }
    return fail(reloc_error::decode_failed);
  }

  switch (arch.arch_mode) {
  case l1::arch::mode::x86_64:
    return detail::relocate_x86_64(disasm.value, target, min_patch_size, trampoline_address);
  case l1::arch::mode::aarch64:
    return detail::relocate_arm64(disasm.value, target, min_patch_size, trampoline_address);
  default:
    return fail(reloc_error::unsupported_arch);
  }
}

size_t max_trampoline_size(size_t min_patch_size, const l1::arch::arch_spec& arch) {
  if (min_patch_size == 0 || min_patch_size > detail::kMaxPatchBytes) {
    return 0;
  }

  // worst case every instruction is rewritten into its far form
  constexpr size_t kX86MinInsn = 1;
  constexpr size_t kX86FarForm = 16;
  constexpr size_t kArm64InsnBytes = 4;
  constexpr size_t kArm64FarForm = 20;

  // the last decoded instruction may extend past min_patch_size
  switch (arch.arch_mode) {
  case l1::arch::mode::x86_64:
    return (min_patch_size / kX86MinInsn + 1) * kX86FarForm;
  case l1::arch::mode::aarch64:
    return ((min_patch_size + kArm64InsnBytes - 1) / kArm64InsnBytes) * kArm64FarForm;
  default:
    break;
  }
  return 0;
}

const char* to_string(reloc_error error) {
  switch (error) {
  case reloc_error::ok:
    return "ok";
  case reloc_error::invalid_target:
    return "invalid_target";
  case reloc_error::invalid_request:
    return "invalid_request";
  case reloc_error::unsupported_arch:
    return "unsupported_arch";
  case reloc_error::decode_failed:
    return "decode_failed";
  case reloc_error::insufficient_bytes:
    return "insufficient_bytes";
  case reloc_error::missing_trampoline:
    return "missing_trampoline";
  case reloc_error::unsupported_instruction:
    return "unsupported_instruction";
  case reloc_error::out_of_range:
    return "out_of_range";
  }
  return "unknown";
}

} // namespace l1::h00k::reloc
