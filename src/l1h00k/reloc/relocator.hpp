#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "l1base/arch_spec.hpp"

namespace l1::h00k::reloc {

enum class reloc_error {
  ok,
  invalid_target,
  invalid_request,
  unsupported_arch,
  decode_failed,
  insufficient_bytes,
  missing_trampoline,
  unsupported_instruction,
  out_of_range
};

const char* to_string(reloc_error error);

struct reloc_result {
  std::vector<uint8_t> trampoline_bytes{};
  // bytes of whole instructions consumed from the target
  size_t patch_size = 0;
  reloc_error error = reloc_error::invalid_request;

  bool ok() const { return error == reloc_error::ok; }
};

// copies whole instructions covering at least min_patch_size bytes of target so they run
// correctly from trampoline_address
reloc_result relocate(
    const void* target, size_t min_patch_size, uint64_t trampoline_address, const l1::arch::arch_spec& arch
);
size_t max_trampoline_size(size_t min_patch_size, const l1::arch::arch_spec& arch);

} // namespace l1::h00k::reloc
