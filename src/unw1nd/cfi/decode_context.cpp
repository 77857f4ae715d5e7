#include "unw1nd/cfi/decode_context.hpp"

#include <algorithm>
#include <limits>

#include <llvm/BinaryFormat/Dwarf.h>
#include <llvm/DebugInfo/DWARF/DWARFDebugFrame.h>

namespace unw1nd::cfi {

namespace {

namespace dw = llvm::dwarf;
using instruction = dw::CFIProgram::Instruction;

// factored operands wrap instead of overflowing on malformed input
int64_t scale(uint64_t operand, int64_t factor) {
  return static_cast<int64_t>(operand * static_cast<uint64_t>(factor));
}

uint16_t clamp_register(uint64_t register_number) {
  return static_cast<uint16_t>(std::min<uint64_t>(register_number, std::numeric_limits<uint16_t>::max()));
}

} // namespace

struct decode_context::executor {
  static error_info step(
      decode_context& context, const instruction& insn, bool in_common_record, bool& advanced, uint64_t& next_address
  ) noexcept {
    unwind_row& row = context.row_;
    const auto& ops = insn.Ops;
    auto need = [&](size_t count) { return ops.size() >= count; };
    auto bad_operand = [] { return make_decoder_error(cfi_error::invalid_operand, "missing operand"); };

    switch (insn.Opcode) {
    case dw::DW_CFA_nop:
    case dw::DW_CFA_GNU_args_size:
    case dw::DW_CFA_GNU_window_save:
      return {};

    case dw::DW_CFA_advance_loc:
    case dw::DW_CFA_advance_loc1:
    case dw::DW_CFA_advance_loc2:
    case dw::DW_CFA_advance_loc4:
    case dw::DW_CFA_MIPS_advance_loc8:
      if (in_common_record) {
        return make_decoder_error(cfi_error::advance_in_common_record);
      }
      if (!need(1)) {
        return bad_operand();
      }
      if (context.code_alignment_ == 0) {
        return make_decoder_error(cfi_error::invalid_operand, "zero code alignment");
      }
      advanced = true;
      next_address = row.start_address + ops[0] * context.code_alignment_;
      if (next_address < row.start_address) {
        return make_decoder_error(cfi_error::address_out_of_order, "advance wrapped");
      }
      return {};

    case dw::DW_CFA_set_loc:
      if (in_common_record) {
        return make_decoder_error(cfi_error::advance_in_common_record);
      }
      if (!need(1)) {
        return bad_operand();
      }
      if (ops[0] < row.start_address) {
        return make_decoder_error(cfi_error::address_out_of_order, "set_loc moved backwards");
      }
      advanced = true;
      next_address = ops[0];
      return {};

    case dw::DW_CFA_def_cfa:
    case dw::DW_CFA_LLVM_def_aspace_cfa:
      if (!need(2)) {
        return bad_operand();
      }
      row.cfa = cfa_rule::register_and_offset(ops[0], static_cast<int64_t>(ops[1]));
      return {};

    case dw::DW_CFA_def_cfa_sf:
    case dw::DW_CFA_LLVM_def_aspace_cfa_sf:
      if (!need(2)) {
        return bad_operand();
      }
      row.cfa = cfa_rule::register_and_offset(ops[0], scale(ops[1], context.data_alignment_));
      return {};

    case dw::DW_CFA_def_cfa_register:
      if (!need(1)) {
        return bad_operand();
      }
      if (row.cfa.kind != cfa_kind::register_and_offset) {
        return make_decoder_error(cfi_error::cfa_rule_mismatch, "def_cfa_register on expression cfa");
      }
      row.cfa.register_number = ops[0];
      return {};

    case dw::DW_CFA_def_cfa_offset:
    case dw::DW_CFA_def_cfa_offset_sf:
      if (!need(1)) {
        return bad_operand();
      }
      if (row.cfa.kind != cfa_kind::register_and_offset) {
        return make_decoder_error(cfi_error::cfa_rule_mismatch, "def_cfa_offset on expression cfa");
      }
      row.cfa.offset = insn.Opcode == dw::DW_CFA_def_cfa_offset ? static_cast<int64_t>(ops[0])
                                                                : scale(ops[0], context.data_alignment_);
      return {};

    case dw::DW_CFA_def_cfa_expression:
      row.cfa = cfa_rule{cfa_kind::expression, 0, 0};
      return {};

    case dw::DW_CFA_offset:
    case dw::DW_CFA_offset_extended:
    case dw::DW_CFA_offset_extended_sf:
      if (!need(2)) {
        return bad_operand();
      }
      row.set_rule(ops[0], register_rule::at_offset(scale(ops[1], context.data_alignment_)));
      return {};

    case dw::DW_CFA_val_offset:
    case dw::DW_CFA_val_offset_sf:
      if (!need(2)) {
        return bad_operand();
      }
      row.set_rule(ops[0], register_rule::val_offset(scale(ops[1], context.data_alignment_)));
      return {};

    case dw::DW_CFA_register:
      if (!need(2)) {
        return bad_operand();
      }
      row.set_rule(ops[0], register_rule::copy_of(clamp_register(ops[1])));
      return {};

    case dw::DW_CFA_undefined:
      if (!need(1)) {
        return bad_operand();
      }
      row.set_rule(ops[0], register_rule::undefined());
      return {};

    case dw::DW_CFA_same_value:
      if (!need(1)) {
        return bad_operand();
      }
      row.set_rule(ops[0], register_rule::same_value());
      return {};

    case dw::DW_CFA_restore:
    case dw::DW_CFA_restore_extended:
      if (in_common_record) {
        return make_decoder_error(cfi_error::restore_outside_descriptor);
      }
      if (!need(1)) {
        return bad_operand();
      }
      row.set_rule(ops[0], context.initial_row_.rule_for(ops[0]));
      return {};

    case dw::DW_CFA_remember_state: {
      if (context.remembered_count_ == remember_capacity) {
        return make_decoder_error(cfi_error::remember_stack_overflow);
      }
      saved_rules& saved = context.remembered_[context.remembered_count_++];
      saved.cfa = row.cfa;
      saved.rules = row.rules;
      return {};
    }

    case dw::DW_CFA_restore_state: {
      if (context.remembered_count_ == 0) {
        return make_decoder_error(cfi_error::remember_stack_underflow);
      }
      const saved_rules& saved = context.remembered_[--context.remembered_count_];
      row.cfa = saved.cfa;
      row.rules = saved.rules;
      return {};
    }

    case dw::DW_CFA_expression:
      if (!need(1)) {
        return bad_operand();
      }
      row.set_rule(ops[0], register_rule{rule_kind::expression, 0, 0});
      return {};

    case dw::DW_CFA_val_expression:
      if (!need(1)) {
        return bad_operand();
      }
      row.set_rule(ops[0], register_rule{rule_kind::val_expression, 0, 0});
      return {};

    default:
      return make_decoder_error(cfi_error::invalid_instruction, "unhandled call frame instruction");
    }
  }
};

error_info decode_context::initialize(const llvm::dwarf::CIE& common_record) noexcept {
  reset();
  common_record_ = &common_record;
  code_alignment_ = common_record.getCodeAlignmentFactor();
  data_alignment_ = common_record.getDataAlignmentFactor();
  row_ = unwind_row{};

  for (const instruction& insn : common_record.cfis()) {
    bool advanced = false;
    uint64_t next_address = 0;
    const error_info error = executor::step(*this, insn, true, advanced, next_address);
    if (!error.ok()) {
      reset();
      return error;
    }
  }

  initial_row_ = row_;
  // remembered state does not carry over from the common record into a descriptor
  remembered_count_ = 0;
  state_ = state::initialized;
  return {};
}

error_info decode_context::begin(const frame_descriptor& descriptor) noexcept {
  if (state_ == state::empty) {
    return make_decoder_error(cfi_error::context_uninitialized, "begin before initialize");
  }
  if (descriptor.empty() || descriptor.common_record() != common_record_) {
    return make_decoder_error(cfi_error::missing_common_record, "descriptor not linked to initialized record");
  }

  const uint64_t start = descriptor.initial_address();
  const uint64_t end = start + descriptor.length();
  if (end < start) {
    return make_decoder_error(cfi_error::malformed_section, "descriptor range wraps");
  }

  descriptor_ = descriptor.raw();
  descriptor_end_ = end;
  next_instruction_ = 0;
  remembered_count_ = 0;
  row_ = initial_row_;
  row_.start_address = start;
  row_.end_address = end;
  state_ = state::running;
  return {};
}

result<bool> decode_context::next_row(unwind_row& out) noexcept {
  if (state_ == state::finished) {
    return ok_result(false);
  }
  if (state_ != state::running) {
    return error_result<bool>(make_decoder_error(cfi_error::context_uninitialized, "next_row before begin"));
  }

  const auto& program = descriptor_->cfis();
  const size_t count = program.size();
  while (next_instruction_ < count) {
    const instruction& insn = program.begin()[next_instruction_++];
    bool advanced = false;
    uint64_t next_address = 0;
    const error_info error = executor::step(*this, insn, false, advanced, next_address);
    if (!error.ok()) {
      state_ = state::finished;
      return error_result<bool>(error);
    }
    if (!advanced) {
      continue;
    }

    const uint64_t start = row_.start_address;
    const uint64_t end = std::min(next_address, descriptor_end_);
    row_.start_address = next_address;
    if (start >= end) {
      continue;
    }
    out = row_;
    out.start_address = start;
    out.end_address = end;
    return ok_result(true);
  }

  state_ = state::finished;
  if (row_.start_address >= descriptor_end_) {
    return ok_result(false);
  }
  out = row_;
  out.end_address = descriptor_end_;
  return ok_result(true);
}

void decode_context::reset() noexcept {
  state_ = state::empty;
  common_record_ = nullptr;
  descriptor_ = nullptr;
  code_alignment_ = 1;
  data_alignment_ = 1;
  next_instruction_ = 0;
  descriptor_end_ = 0;
  remembered_count_ = 0;
}

} // namespace unw1nd::cfi
