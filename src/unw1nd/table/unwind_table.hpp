#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "unw1nd/table/unwind_entry.hpp"

namespace unw1nd::table {

/**
 * @brief address-ordered index of unwind entries
 * @details built and frozen at configuration time, then only read. entries of
 * a well-formed binary never overlap; find() relies on it.
 */
class unwind_table {
public:
  unwind_table() = default;

  void add(unwind_entry entry);
  void clear() noexcept;

  /**
   * @brief sort entries by range start
   * @return number of adjacent entry pairs found overlapping, zero for a well-formed table
   */
  size_t freeze();

  /**
   * @brief locate the entry whose [start, end) covers address (hot path)
   * @return entry or nullptr for a gap
   * @note binary search, no allocation, no logging
   */
  const unwind_entry* find(uint64_t address) const noexcept;

  size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  bool frozen() const noexcept { return frozen_; }
  std::span<const unwind_entry> entries() const noexcept { return entries_; }

private:
  std::vector<unwind_entry> entries_;
  bool frozen_ = false;
};

} // namespace unw1nd::table
