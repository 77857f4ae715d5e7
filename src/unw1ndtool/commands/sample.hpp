#pragma once

#include <cstddef>

#include "common.hpp"

namespace unw1ndtool::commands {

struct sample_options {
  common_options common{};
  size_t samples = 3;
};

// walks the stack from inside a SIGPROF handler and prints what the handler recorded
int sample(const sample_options& options);

} // namespace unw1ndtool::commands
