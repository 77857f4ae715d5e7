#include "unw1nd/cfi/frame_descriptor.hpp"

#include <llvm/DebugInfo/DWARF/DWARFDebugFrame.h>

namespace unw1nd::cfi {

uint64_t frame_descriptor::initial_address() const noexcept { return entry_ ? entry_->getInitialLocation() : 0; }

uint64_t frame_descriptor::length() const noexcept { return entry_ ? entry_->getAddressRange() : 0; }

const llvm::dwarf::CIE* frame_descriptor::common_record() const noexcept {
  return entry_ ? entry_->getLinkedCIE() : nullptr;
}

size_t frame_descriptor::instruction_count() const noexcept { return entry_ ? entry_->cfis().size() : 0; }

} // namespace unw1nd::cfi
