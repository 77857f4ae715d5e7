#pragma once

#include <cstdint>
#include <deque>
#include <initializer_list>
#include <map>
#include <memory>
#include <vector>

#include <llvm/ADT/None.h>
#include <llvm/ADT/SmallString.h>
#include <llvm/ADT/Triple.h>
#include <llvm/BinaryFormat/Dwarf.h>
#include <llvm/DebugInfo/DWARF/DWARFDebugFrame.h>

#include "unw1nd/cfi/frame_descriptor.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/table/unwind_entry.hpp"
#include "unw1nd/types.hpp"

namespace unw1nd_test {

namespace dw = llvm::dwarf;

inline void emit(dw::CFIProgram& program, uint8_t opcode, std::initializer_list<uint64_t> operands = {}) {
  dw::CFIProgram::Instruction insn(opcode);
  for (uint64_t operand : operands) {
    insn.Ops.push_back(operand);
  }
  program.addInstruction(insn);
}

// a common record and its descriptors, built directly instead of decoded from bytes
class synthetic_cfi : public std::enable_shared_from_this<synthetic_cfi> {
public:
  static std::shared_ptr<synthetic_cfi> create(uint64_t code_alignment = 1, int64_t data_alignment = -8) {
    return std::shared_ptr<synthetic_cfi>(new synthetic_cfi(code_alignment, data_alignment));
  }

  dw::CFIProgram& common_program() { return common_.cfis(); }
  const dw::CIE& common() const { return common_; }

  dw::FDE& add_descriptor(uint64_t start, uint64_t length) {
    descriptors_.emplace_back(
        false, descriptors_.size() * 0x20 + 0x18, 0, 0, start, length, &common_, llvm::None, llvm::Triple::x86_64
    );
    return descriptors_.back();
  }

  unw1nd::cfi::frame_descriptor descriptor(const dw::FDE& entry) {
    return unw1nd::cfi::frame_descriptor(std::shared_ptr<const dw::FDE>(shared_from_this(), &entry));
  }

  unw1nd::table::unwind_entry entry(const dw::FDE& descriptor_entry, int64_t bias = 0) {
    return unw1nd::table::unwind_entry::from_descriptor(bias, descriptor(descriptor_entry)).value;
  }

private:
  synthetic_cfi(uint64_t code_alignment, int64_t data_alignment)
      : common_(
            false, 0, 0, 1, llvm::SmallString<8>(), 8, 0, code_alignment, data_alignment, 16, llvm::SmallString<8>(),
            dw::DW_EH_PE_absptr, dw::DW_EH_PE_omit, llvm::None, llvm::None, llvm::Triple::x86_64
        ) {}

  dw::CIE common_;
  std::deque<dw::FDE> descriptors_;
};

// word-addressed fake memory that counts reads
struct map_reader {
  std::map<unw1nd::word, unw1nd::word> words;
  mutable size_t reads = 0;

  unw1nd::result<unw1nd::word> read(unw1nd::word address) const {
    ++reads;
    const auto it = words.find(address);
    if (it == words.end()) {
      unw1nd::error_info error = unw1nd::make_error(unw1nd::error_code::memory_read_failed);
      error.address = address;
      return unw1nd::error_result<unw1nd::word>(error);
    }
    return unw1nd::ok_result(it->second);
  }
};

// .eh_frame as gcc emits it for one function at 0x1000..0x1020, section stated at 0x2000:
//   push %rbp; mov %rsp,%rbp; ...
inline constexpr uint64_t sample_section_address = 0x2000;

inline std::vector<uint8_t> sample_eh_frame() {
  return {
      // cie: length 0x14, id 0, version 1, "zR", code 1, data -8, ra 16, aug len 1, pcrel|sdata4
      0x14, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x7a, 0x52, 0x00, 0x01, 0x78, 0x10, 0x01, 0x1b,
      // def_cfa r7+8; offset r16 at cfa-8; nop nop
      0x0c, 0x07, 0x08, 0x90, 0x01, 0x00, 0x00,
      // fde: length 0x18, cie pointer 0x1c, initial 0x1000 (pc-relative from 0x2020), range 0x20, aug len 0
      0x18, 0x00, 0x00, 0x00, 0x1c, 0x00, 0x00, 0x00, 0xe0, 0xef, 0xff, 0xff, 0x20, 0x00, 0x00, 0x00, 0x00,
      // advance 1; def_cfa_offset 16; offset r6 at cfa-16; advance 3; def_cfa_register r6; nop x3
      0x41, 0x0e, 0x10, 0x86, 0x02, 0x43, 0x0d, 0x06, 0x00, 0x00, 0x00,
      // terminator
      0x00, 0x00, 0x00, 0x00,
  };
}

} // namespace unw1nd_test
