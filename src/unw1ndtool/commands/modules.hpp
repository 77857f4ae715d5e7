#pragma once

#include "common.hpp"

namespace unw1ndtool::commands {

struct modules_options {
  common_options common{};
};

// lists every loaded image with an .eh_frame and how many entries it yields
int modules(const modules_options& options);

} // namespace unw1ndtool::commands
