#include "common.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <exception>
#include <iterator>

namespace unw1ndtool::commands {

std::string format_word(unw1nd::tagged_word value) {
  if (value.is_invalid()) {
    return "?";
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "0x%016llx", static_cast<unsigned long long>(value.value()));
  return buffer;
}

std::string describe_error(const unw1nd::error_info& error) {
  std::array<char, 160> buffer{};
  const size_t length = unw1nd::describe(error, buffer.data(), buffer.size());
  return std::string(buffer.data(), length);
}

bool parse_address(const std::string& text, uint64_t& out) {
  if (text.empty()) {
    return false;
  }
  try {
    size_t consumed = 0;
    out = std::stoull(text, &consumed, 0);
    return consumed == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

redlog::level redlog_level_for(int verbose) {
  static constexpr redlog::level levels[] = {
      redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug, redlog::level::pedantic
  };
  constexpr int last = static_cast<int>(std::size(levels)) - 1;
  return levels[std::clamp(verbose, 0, last)];
}

void apply_verbosity(int verbose) { redlog::set_level(redlog_level_for(verbose)); }

unw1nd::log::log_level walk_log_threshold(int verbose) {
  return verbose >= 2 ? unw1nd::log::log_level::trace : unw1nd::log::log_level::debug;
}

} // namespace unw1ndtool::commands
