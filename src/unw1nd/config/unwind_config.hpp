#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "unw1nd/runtime/module_sections.hpp"

namespace unw1nd::config {

// where the walker's own step messages go
enum class walk_log_sink { none, stderr_sink, redlog_sink };

const char* to_string(walk_log_sink sink) noexcept;

/**
 * @brief process-wide unwinder settings
 * @details read from UNW1ND_VERBOSE, UNW1ND_MAX_FRAMES, UNW1ND_SKIP_MODULES and
 * UNW1ND_WALK_LOG; command line flags override these.
 */
struct unwind_config {
  int verbose = 0;
  size_t max_frames = 128;
  std::vector<std::string> skip_modules;
  walk_log_sink walk_log = walk_log_sink::none;

  static unwind_config from_environment();

  runtime::section_filter to_section_filter() const;
};

} // namespace unw1nd::config
