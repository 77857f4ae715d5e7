#pragma once

#include <cstdint>

#include "common.hpp"

namespace unw1ndtool::commands {

struct rows_options {
  common_options common{};
  // runtime address to explain; zero means an address inside this tool
  uint64_t address = 0;
};

// finds the entry covering an address and prints its decoded rows
int rows(const rows_options& options);

} // namespace unw1ndtool::commands
