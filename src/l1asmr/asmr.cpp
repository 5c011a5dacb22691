#include "l1asmr/asmr.hpp"

#include <capstone/arm64.h>
#include <capstone/capstone.h>
#include <capstone/x86.h>
#include <keystone/keystone.h>

#include <memory>
#include <string>
#include <utility>

namespace l1::asmr {

namespace {

struct engine_config {
  cs_arch cs_arch_value = CS_ARCH_X86;
  cs_mode cs_mode_value = CS_MODE_64;
  ks_arch ks_arch_value = KS_ARCH_X86;
  ks_mode ks_mode_value = KS_MODE_64;
};

bool is_x86(mode mode_value) { return mode_value == mode::x86_32 || mode_value == mode::x86_64; }

result<engine_config> engine_config_for(mode mode_value) {
  engine_config cfg;
  switch (mode_value) {
  case mode::x86_32:
    cfg.cs_mode_value = CS_MODE_32;
    cfg.ks_mode_value = KS_MODE_32;
    return ok_result(cfg);
  case mode::x86_64:
    return ok_result(cfg);
  case mode::aarch64:
#ifdef CAPSTONE_AARCH64_COMPAT_HEADER
    cfg.cs_arch_value = CS_ARCH_ARM64;
#else
    cfg.cs_arch_value = CS_ARCH_AARCH64;
#endif
    cfg.cs_mode_value = CS_MODE_LITTLE_ENDIAN;
    cfg.ks_arch_value = KS_ARCH_ARM64;
    cfg.ks_mode_value = KS_MODE_LITTLE_ENDIAN;
    return ok_result(cfg);
  default:
    break;
  }
  return error_result<engine_config>(
      error_code::unsupported, std::string("unsupported architecture: ") + std::string(l1::arch::mode_name(mode_value))
  );
}

void assign_reg_name(csh handle, uint32_t reg_id, std::string& out) {
  if (reg_id == 0) {
    return;
  }
  const char* name = cs_reg_name(handle, reg_id);
  if (name) {
    out = name;
  }
}

void append_x86_operands(csh handle, const cs_x86& detail, instruction& inst) {
  inst.encoding_info.imm_offset = detail.encoding.imm_offset;
  inst.encoding_info.imm_size = detail.encoding.imm_size;
  inst.encoding_info.disp_offset = detail.encoding.disp_offset;
  inst.encoding_info.disp_size = detail.encoding.disp_size;
  inst.encoding_info.modrm_offset = detail.encoding.modrm_offset;

  inst.operand_details.reserve(detail.op_count);
  for (uint8_t i = 0; i < detail.op_count; ++i) {
    const auto& op = detail.operands[i];
    operand out;
    switch (static_cast<int>(op.type)) {
    case X86_OP_REG:
      out.kind = operand_kind::reg;
      out.reg_id = op.reg;
      assign_reg_name(handle, op.reg, out.reg_name);
      break;
    case X86_OP_IMM:
      out.kind = operand_kind::imm;
      out.imm = op.imm;
      break;
    case X86_OP_MEM:
      out.kind = operand_kind::mem;
      out.mem_base = op.mem.base;
      out.mem_index = op.mem.index;
      out.mem_scale = op.mem.scale;
      out.mem_disp = op.mem.disp;
      if (op.mem.base == X86_REG_RIP) {
        inst.is_pc_relative = true;
      }
      break;
    default:
      continue;
    }
    inst.operand_details.push_back(std::move(out));
  }
}

void append_arm64_operands(csh handle, const cs_arm64& detail, instruction& inst) {
  inst.operand_details.reserve(detail.op_count);
  for (uint8_t i = 0; i < detail.op_count; ++i) {
    const auto& op = detail.operands[i];
    operand out;
    switch (static_cast<int>(op.type)) {
    case ARM64_OP_REG:
      out.kind = operand_kind::reg;
      out.reg_id = op.reg;
      assign_reg_name(handle, op.reg, out.reg_name);
      break;
    case ARM64_OP_MEM:
      out.kind = operand_kind::mem;
      out.mem_base = op.mem.base;
      out.mem_index = op.mem.index;
      out.mem_disp = op.mem.disp;
      break;
    case ARM64_OP_IMM:
    case ARM64_OP_CIMM:
      out.kind = operand_kind::imm;
      out.imm = op.imm;
      break;
    default:
      continue;
    }
    inst.operand_details.push_back(std::move(out));
  }
}

const cs_arm64& arm64_detail(const cs_detail& detail) {
#ifdef CAPSTONE_AARCH64_COMPAT_HEADER
  return detail.arm64;
#else
  return detail.aarch64;
#endif
}

} // namespace

std::string_view to_string(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::not_found:
    return "not_found";
  case error_code::unsupported:
    return "unsupported";
  case error_code::invalid_context:
    return "invalid_context";
  case error_code::internal_error:
    return "internal_error";
  }
  return "unknown";
}

struct context::backend {
  csh capstone = 0;
  ks_engine* keystone = nullptr;

  ~backend() {
    if (keystone) {
      ks_close(keystone);
      keystone = nullptr;
    }
    if (capstone) {
      cs_close(&capstone);
      capstone = 0;
    }
  }
};

context::~context() = default;

context::context(mode mode_value, std::unique_ptr<backend> backend) : backend_(std::move(backend)), mode_(mode_value) {}

result<context> context::for_mode(mode mode_value) {
  auto cfg = engine_config_for(mode_value);
  if (!cfg.ok()) {
    return error_result<context>(cfg.status_info.code, cfg.status_info.message);
  }

  auto backend = std::make_unique<context::backend>();

  cs_err cs_status = cs_open(cfg.value.cs_arch_value, cfg.value.cs_mode_value, &backend->capstone);
  if (cs_status != CS_ERR_OK) {
    return error_result<context>(
        error_code::internal_error, std::string("capstone init failed: ") + cs_strerror(cs_status)
    );
  }

  cs_status = cs_option(backend->capstone, CS_OPT_DETAIL, CS_OPT_ON);
  if (cs_status != CS_ERR_OK) {
    return error_result<context>(
        error_code::internal_error, std::string("capstone option failed: ") + cs_strerror(cs_status)
    );
  }

  ks_err ks_status = ks_open(cfg.value.ks_arch_value, cfg.value.ks_mode_value, &backend->keystone);
  if (ks_status != KS_ERR_OK) {
    return error_result<context>(
        error_code::internal_error, std::string("keystone init failed: ") + ks_strerror(ks_status)
    );
  }

  if (is_x86(mode_value)) {
    cs_option(backend->capstone, CS_OPT_SYNTAX, CS_OPT_SYNTAX_INTEL);
    ks_option(backend->keystone, KS_OPT_SYNTAX, KS_OPT_SYNTAX_INTEL);
  }

  return ok_result(context(mode_value, std::move(backend)));
}

result<context> context::for_host() { return for_mode(l1::arch::detect_host_arch_spec().arch_mode); }

result<std::vector<uint8_t>> context::assemble(std::string_view text, uint64_t address) const {
  if (!backend_ || !backend_->keystone) {
    return error_result<std::vector<uint8_t>>(error_code::invalid_context, "asmr context not initialized");
  }

  if (text.empty()) {
    return error_result<std::vector<uint8_t>>(error_code::invalid_argument, "assembly input is empty");
  }

  std::string input(text);
  unsigned char* encode = nullptr;
  size_t size = 0;
  size_t count = 0;

  int status = ks_asm(backend_->keystone, input.c_str(), address, &encode, &size, &count);
  if (status != 0) {
    ks_err ks_error = ks_errno(backend_->keystone);
    return error_result<std::vector<uint8_t>>(
        error_code::invalid_argument, std::string("keystone assemble failed: ") + ks_strerror(ks_error)
    );
  }

  std::vector<uint8_t> output(encode, encode + size);
  ks_free(encode);
  return ok_result(std::move(output));
}

result<std::vector<instruction>> context::disassemble(std::span<const uint8_t> bytes, uint64_t address) const {
  return disassemble(bytes, address, 0);
}

result<std::vector<instruction>> context::disassemble(
    std::span<const uint8_t> bytes, uint64_t address, size_t max_count
) const {
  if (!backend_ || !backend_->capstone) {
    return error_result<std::vector<instruction>>(error_code::invalid_context, "asmr context not initialized");
  }

  if (bytes.empty()) {
    return error_result<std::vector<instruction>>(error_code::invalid_argument, "disassembly input is empty");
  }

  cs_insn* insn = nullptr;
  size_t count = cs_disasm(backend_->capstone, bytes.data(), bytes.size(), address, max_count, &insn);
  if (count == 0 || !insn) {
    return error_result<std::vector<instruction>>(error_code::not_found, "no instructions decoded");
  }

  std::vector<instruction> output;
  output.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const auto& entry = insn[i];
    instruction inst;
    inst.address = entry.address;
    inst.bytes.assign(entry.bytes, entry.bytes + entry.size);
    inst.mnemonic = entry.mnemonic;
    inst.operands = entry.op_str;
    inst.id = entry.id;
    inst.is_branch_relative = cs_insn_group(backend_->capstone, &entry, CS_GRP_BRANCH_RELATIVE);

    if (entry.detail) {
      if (is_x86(mode_)) {
        append_x86_operands(backend_->capstone, entry.detail->x86, inst);
      } else if (mode_ == mode::aarch64) {
        append_arm64_operands(backend_->capstone, arm64_detail(*entry.detail), inst);
      }
    }

    output.push_back(std::move(inst));
  }

  cs_free(insn, count);
  return ok_result(std::move(output));
}

} // namespace l1::asmr
