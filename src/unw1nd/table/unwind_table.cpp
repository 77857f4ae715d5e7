#include "unw1nd/table/unwind_table.hpp"

#include <algorithm>

#include <redlog.hpp>

namespace unw1nd::table {

void unwind_table::add(unwind_entry entry) {
  entries_.push_back(std::move(entry));
  frozen_ = false;
}

void unwind_table::clear() noexcept {
  entries_.clear();
  frozen_ = false;
}

size_t unwind_table::freeze() {
  auto log = redlog::get_logger("unw1nd.table");

  std::stable_sort(entries_.begin(), entries_.end(), [](const unwind_entry& left, const unwind_entry& right) {
    return left.range.start < right.range.start;
  });

  size_t overlaps = 0;
  for (size_t i = 1; i < entries_.size(); ++i) {
    if (util::range_overlaps(entries_[i - 1].range, entries_[i].range)) {
      ++overlaps;
      log.dbg(
          "overlapping unwind entries", redlog::field("first", "0x%llx", (unsigned long long) entries_[i - 1].range.start),
          redlog::field("second", "0x%llx", (unsigned long long) entries_[i].range.start)
      );
    }
  }

  if (overlaps > 0) {
    log.wrn("unwind table has overlapping entries", redlog::field("count", overlaps));
  }
  log.vrb("unwind table frozen", redlog::field("entries", entries_.size()));

  frozen_ = true;
  return overlaps;
}

const unwind_entry* unwind_table::find(uint64_t address) const noexcept {
  size_t low = 0;
  size_t high = entries_.size();
  while (low < high) {
    const size_t mid = low + (high - low) / 2;
    const unwind_entry& entry = entries_[mid];
    if (address < entry.range.start) {
      high = mid;
    } else if (address >= entry.range.end) {
      low = mid + 1;
    } else {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace unw1nd::table
