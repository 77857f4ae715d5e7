#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <redlog.hpp>

#include "unw1nd/config/unwind_config.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/log/unwind_logger.hpp"
#include "unw1nd/runtime/module_sections.hpp"
#include "unw1nd/tagged_word.hpp"

namespace unw1ndtool::commands {

// settings shared by every command, environment first, then flags
struct common_options {
  unw1nd::config::unwind_config config{};
};

std::string format_word(unw1nd::tagged_word value);

std::string describe_error(const unw1nd::error_info& error);

// parses 0x-prefixed hex or decimal; false on garbage
bool parse_address(const std::string& text, uint64_t& out);

// -v count to redlog level: info, verbose, trace, debug, then pedantic
redlog::level redlog_level_for(int verbose);

void apply_verbosity(int verbose);

// walk-path log threshold for the requested sink
unw1nd::log::log_level walk_log_threshold(int verbose);

} // namespace unw1ndtool::commands
