#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace llvm::dwarf {
class CIE;
class FDE;
} // namespace llvm::dwarf

namespace unw1nd::cfi {

/**
 * @brief shared handle on one decoded frame description entry
 * @details keeps the owning section alive; copies share the decoded data.
 * a default-constructed descriptor is empty and reports a zero range.
 */
class frame_descriptor {
public:
  frame_descriptor() = default;
  explicit frame_descriptor(std::shared_ptr<const llvm::dwarf::FDE> entry) : entry_(std::move(entry)) {}

  bool empty() const noexcept { return entry_ == nullptr; }

  // link-time address of the first covered instruction
  uint64_t initial_address() const noexcept;
  uint64_t length() const noexcept;

  // nullptr when the entry has no linked common record
  const llvm::dwarf::CIE* common_record() const noexcept;

  size_t instruction_count() const noexcept;

  const llvm::dwarf::FDE* raw() const noexcept { return entry_.get(); }

private:
  std::shared_ptr<const llvm::dwarf::FDE> entry_;
};

} // namespace unw1nd::cfi
