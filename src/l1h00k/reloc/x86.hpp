#pragma once

#include <cstddef>
#include <cstdint>

#include "l1h00k/reloc/relocator.hpp"

namespace l1::asmr {
class context;
}

namespace l1::h00k::reloc::detail {

reloc_result relocate_x86_64(
    const l1::asmr::context& disasm, const void* target, size_t min_patch_size, uint64_t trampoline_address
);

} // namespace l1::h00k::reloc::detail
