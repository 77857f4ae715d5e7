#pragma once

#include "common.hpp"

namespace unw1ndtool::commands {

struct backtrace_options {
  common_options common{};
};

// walks this process's own stack from the current frame and prints every frame
int backtrace(const backtrace_options& options);

} // namespace unw1ndtool::commands
