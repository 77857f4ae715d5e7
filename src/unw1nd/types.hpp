#pragma once

#include <cstdint>

namespace unw1nd {

// native machine word; every register and stack slot is read at this width
using word = uintptr_t;

// half-open [start, end) of relocated runtime addresses
struct address_range {
  uint64_t start = 0;
  uint64_t end = 0;
};

} // namespace unw1nd
