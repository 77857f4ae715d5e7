#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "unw1nd/util/interval.hpp"

namespace unw1nd::cfi {

enum class rule_kind : uint8_t {
  unspecified,
  undefined,
  same_value,
  offset,
  val_offset,
  register_copy,
  expression,
  val_expression,
  architectural
};

// how to recover one register of the caller; offsets are already scaled by the data alignment factor
struct register_rule {
  rule_kind kind = rule_kind::unspecified;
  uint16_t register_number = 0;
  int64_t offset = 0;

  static constexpr register_rule undefined() { return {rule_kind::undefined, 0, 0}; }
  static constexpr register_rule same_value() { return {rule_kind::same_value, 0, 0}; }
  static constexpr register_rule at_offset(int64_t offset) { return {rule_kind::offset, 0, offset}; }
  static constexpr register_rule val_offset(int64_t offset) { return {rule_kind::val_offset, 0, offset}; }
  static constexpr register_rule copy_of(uint16_t source) { return {rule_kind::register_copy, source, 0}; }

  friend constexpr bool operator==(const register_rule&, const register_rule&) = default;
};

enum class cfa_kind : uint8_t { register_and_offset, expression };

struct cfa_rule {
  cfa_kind kind = cfa_kind::register_and_offset;
  uint64_t register_number = 0;
  int64_t offset = 0;

  static constexpr cfa_rule register_and_offset(uint64_t register_number, int64_t offset) {
    return {cfa_kind::register_and_offset, register_number, offset};
  }

  friend constexpr bool operator==(const cfa_rule&, const cfa_rule&) = default;
};

// register numbers at or above this are not tracked by any supported architecture
inline constexpr size_t max_tracked_registers = 32;

/**
 * @brief one row of a frame descriptor's unwind table
 * @details addresses are link-time (stated) addresses; the walker compares
 * them against the instruction pointer minus the module bias.
 */
struct unwind_row {
  uint64_t start_address = 0;
  uint64_t end_address = 0;
  cfa_rule cfa{};
  std::array<register_rule, max_tracked_registers> rules{};

  constexpr bool contains(uint64_t address) const noexcept {
    return util::range_contains(start_address, end_address, address);
  }

  constexpr register_rule rule_for(uint64_t register_number) const noexcept {
    if (register_number >= max_tracked_registers) {
      return register_rule{};
    }
    return rules[register_number];
  }

  // false when the register is beyond the tracked set and the rule was dropped
  constexpr bool set_rule(uint64_t register_number, register_rule rule) noexcept {
    if (register_number >= max_tracked_registers) {
      return false;
    }
    rules[register_number] = rule;
    return true;
  }
};

} // namespace unw1nd::cfi
