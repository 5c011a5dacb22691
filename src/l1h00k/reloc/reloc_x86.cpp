#include "l1h00k/reloc/x86.hpp"

#include <span>

#include "l1asmr/asmr.hpp"
#include "l1h00k/reloc/common.hpp"

namespace l1::h00k::reloc::detail {
namespace {

enum class branch_kind {
  none,
  jmp,
  call,
  jcc
};

struct branch_info {
  branch_kind kind = branch_kind::none;
  uint8_t cond = 0;
  uint64_t target = 0;
};

branch_kind classify_branch(const l1::asmr::instruction& insn, uint8_t& cond_out) {
  cond_out = 0;
  if (insn.bytes.empty()) {
    return branch_kind::none;
  }
  const uint8_t op0 = insn.bytes[0];
  if (op0 == 0xE9 || op0 == 0xEB) {
    return branch_kind::jmp;
  }
  if (op0 == 0xE8) {
    return branch_kind::call;
  }
  if (op0 >= 0x70 && op0 <= 0x7F) {
    cond_out = static_cast<uint8_t>(op0 & 0x0F);
    return branch_kind::jcc;
  }
  if (op0 == 0x0F && insn.bytes.size() >= 2) {
    const uint8_t op1 = insn.bytes[1];
    if (op1 >= 0x80 && op1 <= 0x8F) {
      cond_out = static_cast<uint8_t>(op1 & 0x0F);
      return branch_kind::jcc;
    }
  }
  return branch_kind::none;
}

// jmp qword ptr [rip]; .quad target
void emit_abs_jmp(std::vector<uint8_t>& out, uint64_t target) {
  out.insert(out.end(), {0xFF, 0x25, 0x00, 0x00, 0x00, 0x00});
  append_u64(out, target);
}

// call qword ptr [rip + 2]; jmp +8; .quad target
void emit_abs_call(std::vector<uint8_t>& out, uint64_t target) {
  out.insert(out.end(), {0xFF, 0x15, 0x02, 0x00, 0x00, 0x00, 0xEB, 0x08});
  append_u64(out, target);
}

// inverted short jcc over an absolute jmp
void emit_jcc_far(std::vector<uint8_t>& out, uint64_t target, uint8_t cond) {
  constexpr uint8_t kAbsJmpSize = 14;
  out.push_back(static_cast<uint8_t>(0x70 | (cond ^ 0x1)));
  out.push_back(kAbsJmpSize);
  emit_abs_jmp(out, target);
}

void emit_far_branch(std::vector<uint8_t>& out, const branch_info& branch) {
  switch (branch.kind) {
  case branch_kind::jmp:
    emit_abs_jmp(out, branch.target);
    break;
  case branch_kind::call:
    emit_abs_call(out, branch.target);
    break;
  case branch_kind::jcc:
    emit_jcc_far(out, branch.target, branch.cond);
    break;
  case branch_kind::none:
    break;
  }
}

bool fix_rip_relative(
    std::vector<uint8_t>& out, const l1::asmr::instruction& insn, uint64_t new_address, size_t out_base,
    reloc_error& error
) {
  const auto& enc = insn.encoding_info;
  if (enc.disp_size == 0) {
    error = reloc_error::unsupported_instruction;
    return false;
  }
  const int64_t orig_disp = read_signed_le(insn.bytes.data() + enc.disp_offset, enc.disp_size);
  const uint64_t referenced = insn.address + insn.bytes.size() + orig_disp;
  const int64_t new_disp = static_cast<int64_t>(referenced - (new_address + insn.bytes.size()));
  if (!write_signed_le(out, out_base + enc.disp_offset, enc.disp_size, new_disp)) {
    error = reloc_error::out_of_range;
    return false;
  }
  return true;
}

} // namespace

reloc_result relocate_x86_64(
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

    const size_t out_base = out.size();
    const uint64_t new_address = trampoline_address + out_base;
    if ((insn.is_branch_relative || insn.is_pc_relative) && trampoline_address == 0) {
      return fail(reloc_error::missing_trampoline);
    }

    if (insn.is_branch_relative) {
      branch_info branch{};
      branch.kind = classify_branch(insn, branch.cond);
      const auto& enc = insn.encoding_info;
      if (branch.kind == branch_kind::none || enc.imm_size == 0) {
        return fail(reloc_error::unsupported_instruction);
      }
      const int64_t orig_disp = read_signed_le(insn.bytes.data() + enc.imm_offset, enc.imm_size);
      branch.target = insn.address + insn.bytes.size() + orig_disp;

      out.insert(out.end(), insn.bytes.begin(), insn.bytes.end());
      const int64_t new_disp = static_cast<int64_t>(branch.target - (new_address + insn.bytes.size()));
      if (!write_signed_le(out, out_base + enc.imm_offset, enc.imm_size, new_disp)) {
        out.resize(out_base);
        emit_far_branch(out, branch);
      }
    } else {
      out.insert(out.end(), insn.bytes.begin(), insn.bytes.end());
      if (insn.is_pc_relative) {
        reloc_error error = reloc_error::ok;
        if (!fix_rip_relative(out, insn, new_address, out_base, error)) {
          return fail(error);
        }
      }
    }

    consumed += insn.bytes.size();
  }

  if (consumed < min_patch_size) {
    return fail(reloc_error::insufficient_bytes);
  }

  result.patch_size = consumed;
  return result;
}

} // namespace l1::h00k::reloc::detail
