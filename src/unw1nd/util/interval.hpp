#pragma once

#include <cstdint>

#include "unw1nd/types.hpp"

namespace unw1nd::util {

// every range here is half-open: the end address belongs to the next range
constexpr bool range_contains(uint64_t start, uint64_t end, uint64_t address) noexcept {
  return address >= start && address < end;
}

constexpr bool range_contains(const address_range& range, uint64_t address) noexcept {
  return range_contains(range.start, range.end, address);
}

constexpr bool range_overlaps(const address_range& left, const address_range& right) noexcept {
  return left.start < right.end && right.start < left.end;
}

/**
 * @brief move a link-time [start, start + length) to runtime addresses
 * @return false when the relocated end wraps past the top of the address space
 */
constexpr bool relocate_range(uint64_t start, uint64_t length, int64_t bias, address_range* out) noexcept {
  if (!out) {
    return false;
  }

  const uint64_t relocated = start + static_cast<uint64_t>(bias);
  const uint64_t end = relocated + length;
  if (end < relocated) {
    return false;
  }

  *out = address_range{relocated, end};
  return true;
}

} // namespace unw1nd::util
