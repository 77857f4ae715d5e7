#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

#include "unw1nd/cfi/frame_descriptor.hpp"
#include "unw1nd/cfi/unwind_row.hpp"
#include "unw1nd/error.hpp"

namespace unw1nd::cfi {

/**
 * @brief reusable scratch state for evaluating call frame instructions
 * @details interprets instructions the decoder already parsed, producing rows
 * one at a time. storage is fixed-size so stepping never allocates.
 * lifecycle: initialize(common record) -> begin(descriptor) -> next_row()* -> reset().
 */
class decode_context {
public:
  static constexpr size_t remember_capacity = 8;

  decode_context() = default;

  /**
   * @brief run a common record's initial instructions
   * @details the resulting row becomes the target of DW_CFA_restore
   */
  error_info initialize(const llvm::dwarf::CIE& common_record) noexcept;

  // start evaluating a descriptor linked to the initialized common record
  error_info begin(const frame_descriptor& descriptor) noexcept;

  /**
   * @brief evaluate up to the next address advance
   * @return true with out filled when a row was produced, false once the program is exhausted
   */
  result<bool> next_row(unwind_row& out) noexcept;

  void reset() noexcept;

  bool initialized() const noexcept { return state_ != state::empty; }
  const unwind_row& initial_row() const noexcept { return initial_row_; }

private:
  enum class state : uint8_t { empty, initialized, running, finished };

  struct saved_rules {
    cfa_rule cfa{};
    std::array<register_rule, max_tracked_registers> rules{};
  };

  struct executor;

  state state_ = state::empty;
  const llvm::dwarf::CIE* common_record_ = nullptr;
  const llvm::dwarf::FDE* descriptor_ = nullptr;
  uint64_t code_alignment_ = 1;
  int64_t data_alignment_ = 1;
  size_t next_instruction_ = 0;
  uint64_t descriptor_end_ = 0;
  unwind_row initial_row_{};
  unwind_row row_{};
  std::array<saved_rules, remember_capacity> remembered_{};
  size_t remembered_count_ = 0;
};

/**
 * @brief takes a decode context out of its owner for one step
 * @details the context is reset and handed back on destruction, whatever path
 * the step leaves by. a missing context is reported, never dereferenced.
 */
class decode_context_lease {
public:
  explicit decode_context_lease(std::unique_ptr<decode_context>& slot) noexcept
      : slot_(slot), context_(std::move(slot)) {}

  ~decode_context_lease() {
    if (context_) {
      context_->reset();
      slot_ = std::move(context_);
    }
  }

  decode_context_lease(const decode_context_lease&) = delete;
  decode_context_lease& operator=(const decode_context_lease&) = delete;

  explicit operator bool() const noexcept { return context_ != nullptr; }
  decode_context& operator*() const noexcept { return *context_; }
  decode_context* operator->() const noexcept { return context_.get(); }

private:
  std::unique_ptr<decode_context>& slot_;
  std::unique_ptr<decode_context> context_;
};

} // namespace unw1nd::cfi
