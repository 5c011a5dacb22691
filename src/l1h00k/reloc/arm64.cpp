#include "l1h00k/reloc/arm64.hpp"

#include <span>

#include "l1asmr/asmr.hpp"
#include "l1h00k/reloc/common.hpp"

namespace l1::h00k::reloc::detail {
namespace {

constexpr uint8_t kScratchReg = 16;

enum class fixup_kind {
  none,
  b,
  bl,
  bcond,
  cbz,
  tbz,
  adr,
  adrp,
  ldr_literal
};

fixup_kind classify(uint32_t inst) {
  if ((inst & 0xFC000000u) == 0x14000000u) {
    return fixup_kind::b;
  }
  if ((inst & 0xFC000000u) == 0x94000000u) {
    return fixup_kind::bl;
  }
  if ((inst & 0xFF000010u) == 0x54000000u) {
    return fixup_kind::bcond;
  }
  // cbz and cbnz differ in bit 24
  if ((inst & 0x7E000000u) == 0x34000000u) {
    return fixup_kind::cbz;
  }
  // tbz and tbnz differ in bit 24
  if ((inst & 0x7E000000u) == 0x36000000u) {
    return fixup_kind::tbz;
  }
  if ((inst & 0x9F000000u) == 0x10000000u) {
    return fixup_kind::adr;
  }
  if ((inst & 0x9F000000u) == 0x90000000u) {
    return fixup_kind::adrp;
  }
  // 64-bit general register literal load
  if ((inst & 0xFF000000u) == 0x58000000u) {
    return fixup_kind::ldr_literal;
  }
  return fixup_kind::none;
}

uint64_t referenced_address(fixup_kind kind, uint32_t inst, uint64_t pc) {
  switch (kind) {
  case fixup_kind::b:
  case fixup_kind::bl:
    return pc + static_cast<uint64_t>(sign_extend(inst & 0x03FFFFFFu, 26) << 2);
  case fixup_kind::bcond:
  case fixup_kind::cbz:
  case fixup_kind::ldr_literal:
    return pc + static_cast<uint64_t>(sign_extend((inst >> 5) & 0x7FFFFu, 19) << 2);
  case fixup_kind::tbz:
    return pc + static_cast<uint64_t>(sign_extend((inst >> 5) & 0x3FFFu, 14) << 2);
  case fixup_kind::adr:
  case fixup_kind::adrp: {
    const uint32_t immlo = (inst >> 29) & 0x3u;
    const uint32_t immhi = (inst >> 5) & 0x7FFFFu;
    const int64_t imm = sign_extend((immhi << 2) | immlo, 21);
    if (kind == fixup_kind::adr) {
      return pc + static_cast<uint64_t>(imm);
    }
    return (pc & ~0xFFFULL) + static_cast<uint64_t>(imm << 12);
  }
  case fixup_kind::none:
    break;
  }
  return pc;
}

bool patch_field(uint32_t& inst, int64_t offset, unsigned bits, unsigned shift) {
  if (offset % 4 != 0) {
    return false;
  }
  const int64_t imm = offset >> 2;
  if (!fits_signed(imm, bits)) {
    return false;
  }
  const uint32_t mask = (1u << bits) - 1u;
  inst &= ~(mask << shift);
  inst |= (static_cast<uint32_t>(imm) & mask) << shift;
  return true;
}

bool patch_adr_imm(uint32_t& inst, int64_t imm) {
  if (!fits_signed(imm, 21)) {
    return false;
  }
  const uint32_t imm21 = static_cast<uint32_t>(imm) & 0x1FFFFFu;
  inst &= ~((0x3u << 29) | (0x7FFFFu << 5));
  inst |= ((imm21 & 0x3u) << 29) | (((imm21 >> 2) & 0x7FFFFu) << 5);
  return true;
}

// rewrites inst in place for execution at new_pc; false when the displacement no longer fits
bool retarget(fixup_kind kind, uint32_t& inst, uint64_t target, uint64_t new_pc) {
  const int64_t offset = static_cast<int64_t>(target - new_pc);
  switch (kind) {
  case fixup_kind::b:
  case fixup_kind::bl:
    return patch_field(inst, offset, 26, 0);
  case fixup_kind::bcond:
  case fixup_kind::cbz:
  case fixup_kind::ldr_literal:
    return patch_field(inst, offset, 19, 5);
  case fixup_kind::tbz:
    return patch_field(inst, offset, 14, 5);
  case fixup_kind::adr:
    return patch_adr_imm(inst, offset);
  case fixup_kind::adrp:
    return patch_adr_imm(inst, static_cast<int64_t>((target & ~0xFFFULL) - (new_pc & ~0xFFFULL)) >> 12);
  case fixup_kind::none:
    break;
  }
  return true;
}

uint32_t encode_ldr_literal(uint8_t rt, int32_t imm19) {
  return 0x58000000u | ((static_cast<uint32_t>(imm19) & 0x7FFFFu) << 5) | (rt & 0x1Fu);
}

uint32_t encode_br(uint8_t rn) { return 0xD61F0000u | ((rn & 0x1Fu) << 5); }
uint32_t encode_blr(uint8_t rn) { return 0xD63F0000u | ((rn & 0x1Fu) << 5); }
uint32_t encode_b(int32_t imm26) { return 0x14000000u | (static_cast<uint32_t>(imm26) & 0x03FFFFFFu); }

// ldr x16, #8; br/blr x16; .quad target
void emit_abs_branch(std::vector<uint8_t>& out, uint64_t target, bool is_call) {
  append_u32(out, encode_ldr_literal(kScratchReg, 2));
  append_u32(out, is_call ? encode_blr(kScratchReg) : encode_br(kScratchReg));
  append_u64(out, target);
}

// ldr rt, #8; b #12; .quad value
void emit_load_constant(std::vector<uint8_t>& out, uint8_t rt, uint64_t value) {
  append_u32(out, encode_ldr_literal(rt, 2));
  append_u32(out, encode_b(3));
  append_u64(out, value);
}

// inverted condition skipping an absolute branch
bool emit_cond_far(std::vector<uint8_t>& out, fixup_kind kind, uint32_t inst, uint64_t target) {
  constexpr int64_t kSkip = 4 + 16;
  uint32_t skip_inst = inst;
  if (kind == fixup_kind::bcond) {
    skip_inst ^= 0x1u;
    if (!patch_field(skip_inst, kSkip, 19, 5)) {
      return false;
    }
  } else if (kind == fixup_kind::cbz) {
    skip_inst ^= 0x01000000u;
    if (!patch_field(skip_inst, kSkip, 19, 5)) {
      return false;
    }
  } else if (kind == fixup_kind::tbz) {
    skip_inst ^= 0x01000000u;
    if (!patch_field(skip_inst, kSkip, 14, 5)) {
      return false;
    }
  } else {
    return false;
  }
  append_u32(out, skip_inst);
  emit_abs_branch(out, target, false);
  return true;
}

bool emit_far_form(std::vector<uint8_t>& out, fixup_kind kind, uint32_t inst, uint64_t target) {
  const auto rt = static_cast<uint8_t>(inst & 0x1Fu);
  switch (kind) {
  case fixup_kind::b:
  case fixup_kind::bl:
    emit_abs_branch(out, target, kind == fixup_kind::bl);
    return true;
  case fixup_kind::bcond:
  case fixup_kind::cbz:
  case fixup_kind::tbz:
    return emit_cond_far(out, kind, inst, target);
  case fixup_kind::adr:
    emit_load_constant(out, rt, target);
    return true;
  case fixup_kind::adrp:
    emit_load_constant(out, rt, target & ~0xFFFULL);
    return true;
  case fixup_kind::ldr_literal: {
    // materialize the address then load through it
    emit_load_constant(out, rt, target);
    append_u32(out, 0xF9400000u | (static_cast<uint32_t>(rt) << 5) | rt);
    return true;
  }
  case fixup_kind::none:
    break;
  }
  return false;
}

} // namespace

reloc_result relocate_arm64(
    const l1::asmr::context& disasm, const void* target, size_t min_patch_size, uint64_t trampoline_address
) {
  auto fail = [](reloc_error error) {
    reloc_result out{};
    out.error = error;
    return out;
  };

  const auto bytes = std::span<const uint8_t>(static_cast<const uint8_t*>(target), kMaxPatchBytes);
  auto decoded = disasm.disassemble(bytes, reinterpret_cast<uint64_t>(target));
  if (!decoded.ok()) {
    return fail(reloc_error::decode_failed);
  }

  reloc_result result{};
  result.error = reloc_error::ok;
  auto& out = result.trampoline_bytes;

  size_t consumed = 0;
  for (const auto& insn : decoded.value) {
    if (consumed >= min_patch_size) {
      break;
    }
    if (insn.bytes.size() != 4) {
      return fail(reloc_error::unsupported_instruction);
    }

    uint32_t inst = 0;
    std::memcpy(&inst, insn.bytes.data(), sizeof(inst));
    const fixup_kind kind = classify(inst);
    const size_t out_base = out.size();

    if (kind == fixup_kind::none) {
      append_u32(out, inst);
      consumed += 4;
      continue;
    }
    if (trampoline_address == 0) {
      return fail(reloc_error::missing_trampoline);
    }

    const uint64_t referenced = referenced_address(kind, inst, insn.address);
    if (retarget(kind, inst, referenced, trampoline_address + out_base)) {
      append_u32(out, inst);
    } else if (!emit_far_form(out, kind, inst, referenced)) {
      return fail(reloc_error::out_of_range);
    }
    consumed += 4;
  }

  if (consumed < min_patch_size) {
    return fail(reloc_error::insufficient_bytes);
  }

  result.patch_size = consumed;
  return result;
}

} // namespace l1::h00k::reloc::detail
