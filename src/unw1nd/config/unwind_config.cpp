#include "unw1nd/config/unwind_config.hpp"

#include <cstdint>

#include "unw1nd/util/env_config.hpp"

namespace unw1nd::config {

const char* to_string(walk_log_sink sink) noexcept {
  switch (sink) {
  case walk_log_sink::none:
    return "none";
  case walk_log_sink::stderr_sink:
    return "stderr";
  case walk_log_sink::redlog_sink:
    return "redlog";
  }
  return "unknown";
}

unwind_config unwind_config::from_environment() {
  util::env_config env("UNW1ND");
  unwind_config config{};

  config.verbose = env.get<int>("VERBOSE", config.verbose);
  config.max_frames = static_cast<size_t>(env.get<uint64_t>("MAX_FRAMES", config.max_frames));
  config.skip_modules = env.get_list("SKIP_MODULES");
  config.walk_log = env.get_enum<walk_log_sink>(
      {{"none", walk_log_sink::none}, {"stderr", walk_log_sink::stderr_sink}, {"redlog", walk_log_sink::redlog_sink}},
      "WALK_LOG", config.walk_log
  );
  return config;
}

runtime::section_filter unwind_config::to_section_filter() const {
  runtime::section_filter filter{};
  filter.skip_modules = skip_modules;
  return filter;
}

} // namespace unw1nd::config
