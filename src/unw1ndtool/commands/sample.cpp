#include "sample.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <utility>

#include <signal.h>
#include <ucontext.h>

#include <redlog.hpp>

#include "unw1nd/unw1nd.hpp"

namespace unw1ndtool::commands {

namespace {

using unw1nd::registers::frame_registers;
using sampling_walker = unw1nd::walker<unw1nd::memory::process_memory_reader, unw1nd::log::stderr_logger>;

constexpr size_t max_sampled_frames = 64;

// written only by the handler, read after it returns
struct sample_record {
  std::array<frame_registers, max_sampled_frames> frames{};
  size_t count = 0;
  unw1nd::error_info end{};
};

sampling_walker* g_walker = nullptr;
sample_record g_record{};
size_t g_frame_limit = max_sampled_frames;

void on_sigprof(int, siginfo_t*, void* raw_context) {
  g_record.count = 0;
  g_record.end = {};
  if (!g_walker || !raw_context) {
    return;
  }

  const auto start = frame_registers::from_native_context(*static_cast<const ucontext_t*>(raw_context));
  if (!start.ok()) {
    g_record.end = start.error;
    return;
  }

  const auto outcome = g_walker->walk(start.value, [](const frame_registers& frame) {
    g_record.frames[g_record.count++] = frame;
    return g_record.count < g_frame_limit ? unw1nd::walk_control::continue_walk : unw1nd::walk_control::break_walk;
  });
  g_record.end = outcome.error;
}

class handler_guard {
public:
  explicit handler_guard(sampling_walker& walker) {
    g_walker = &walker;
    struct sigaction action {};
    action.sa_sigaction = on_sigprof;
    action.sa_flags = SA_SIGINFO;
    sigemptyset(&action.sa_mask);
    installed_ = sigaction(SIGPROF, &action, &previous_) == 0;
  }

  ~handler_guard() {
    if (installed_) {
      sigaction(SIGPROF, &previous_, nullptr);
    }
    g_walker = nullptr;
  }

  handler_guard(const handler_guard&) = delete;
  handler_guard& operator=(const handler_guard&) = delete;

  bool installed() const { return installed_; }

private:
  struct sigaction previous_ {};
  bool installed_ = false;
};

} // namespace

int sample(const sample_options& options) {
  auto log = redlog::get_logger("unw1ndtool.sample");
  const auto& config = options.common.config;

  unw1nd::options configuration;
  const size_t entries = configuration.find_eh_frame_entries(config.to_section_filter());
  if (entries == 0) {
    std::cerr << "error: no unwind entries found in loaded modules" << std::endl;
    return 1;
  }

  // the handler can only use the signal-safe sink; without a requested log it reports errors only
  const auto threshold = config.walk_log == unw1nd::config::walk_log_sink::none ? unw1nd::log::log_level::error
                                                                                 : walk_log_threshold(config.verbose);
  auto walker =
      std::move(configuration).build_with(unw1nd::memory::process_memory_reader(), unw1nd::log::stderr_logger(threshold));

  g_frame_limit = config.max_frames == 0 ? 1 : std::min(config.max_frames, max_sampled_frames);

  handler_guard guard(walker);
  if (!guard.installed()) {
    log.err("failed to install SIGPROF handler", redlog::field("error", std::strerror(errno)));
    return 1;
  }

  int failures = 0;
  for (size_t i = 0; i < options.samples; ++i) {
    if (raise(SIGPROF) != 0) {
      log.err("raise failed", redlog::field("error", std::strerror(errno)));
      return 1;
    }

    std::cout << "sample " << i << ": " << g_record.count << " frames";
    const auto end = g_record.end.code;
    if (end == unw1nd::error_code::ok || end == unw1nd::error_code::no_unwind_info_for_address ||
        end == unw1nd::error_code::invalid_tagged_word) {
      std::cout << std::endl;
    } else {
      ++failures;
      std::cout << " (" << describe_error(g_record.end) << ")" << std::endl;
    }
    for (size_t frame = 0; frame < g_record.count; ++frame) {
      std::cout << "  #" << frame << " ip=" << format_word(g_record.frames[frame].ip())
                << " sp=" << format_word(g_record.frames[frame].sp()) << std::endl;
    }
  }
  return failures == 0 ? 0 : 1;
}

} // namespace unw1ndtool::commands
