#include "backtrace.hpp"

#include <iostream>
#include <utility>

#include <redlog.hpp>

#include "unw1nd/unw1nd.hpp"

namespace unw1ndtool::commands {

namespace {

using unw1nd::registers::frame_registers;

template <typename Walker> int print_walk(Walker& walker, size_t max_frames) {
  auto log = redlog::get_logger("unw1ndtool.backtrace");

  size_t index = 0;
  const auto outcome = frame_registers::with_current([&](const frame_registers& start) {
    return walker.walk(start, [&](const frame_registers& frame) {
      std::cout << "#" << index << " ip=" << format_word(frame.ip()) << " sp=" << format_word(frame.sp())
                << " bp=" << format_word(frame.bp()) << std::endl;
      ++index;
      return index < max_frames;
    });
  });

  if (outcome.ok()) {
    std::cout << "stopped after " << index << " frames (limit)" << std::endl;
    return 0;
  }
  if (outcome.error.code == unw1nd::error_code::no_unwind_info_for_address) {
    std::cout << "end of stack after " << index << " frames" << std::endl;
    return 0;
  }
  // the outermost frame (_start) marks its return address undefined
  if (outcome.error.code == unw1nd::error_code::invalid_tagged_word) {
    std::cout << "end of stack after " << index << " frames (return address undefined)" << std::endl;
    return 0;
  }

  log.err("walk failed", redlog::field("frames", index), redlog::field("error", describe_error(outcome.error)));
  std::cerr << "error: " << describe_error(outcome.error) << std::endl;
  return 1;
}

} // namespace

int backtrace(const backtrace_options& options) {
  auto log = redlog::get_logger("unw1ndtool.backtrace");
  const auto& config = options.common.config;

  unw1nd::options configuration;
  const size_t entries = configuration.find_eh_frame_entries(config.to_section_filter());
  log.inf("loaded unwind entries", redlog::field("entries", entries));
  if (entries == 0) {
    std::cerr << "error: no unwind entries found in loaded modules" << std::endl;
    return 1;
  }

  const auto threshold = walk_log_threshold(config.verbose);
  switch (config.walk_log) {
  case unw1nd::config::walk_log_sink::stderr_sink: {
    auto walker = std::move(configuration)
                      .build_with(unw1nd::memory::process_memory_reader(), unw1nd::log::stderr_logger(threshold));
    return print_walk(walker, config.max_frames);
  }
  case unw1nd::config::walk_log_sink::redlog_sink: {
    auto walker = std::move(configuration)
                      .build_with(unw1nd::memory::process_memory_reader(), unw1nd::log::redlog_logger(threshold));
    return print_walk(walker, config.max_frames);
  }
  case unw1nd::config::walk_log_sink::none:
    break;
  }

  auto walker = std::move(configuration).build();
  return print_walk(walker, config.max_frames);
}

} // namespace unw1ndtool::commands
