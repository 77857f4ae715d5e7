#include "unw1nd/log/unwind_logger.hpp"

#include <string>

#include "unw1nd/util/stderr_write.hpp"

namespace unw1nd::log {

const char* to_string(log_level level) noexcept {
  switch (level) {
  case log_level::error:
    return "error";
  case log_level::warning:
    return "warning";
  case log_level::info:
    return "info";
  case log_level::debug:
    return "debug";
  case log_level::trace:
    return "trace";
  }
  return "unknown";
}

void stderr_logger::write(log_level level, std::string_view message) const noexcept {
  if (!enabled(level)) {
    return;
  }

  std::array<char, 256> storage{};
  util::format_buffer line(storage.data(), storage.size() - 1);
  line.text("unw1nd[").text(to_string(level)).text("] ").text(message);

  // the newline goes into the slot held back above so a cut line still ends cleanly
  const size_t size = line.size();
  storage[size] = '\n';
  util::stderr_write(storage.data(), size + 1);
}

void redlog_logger::write(log_level level, std::string_view message) const {
  if (!enabled(level)) {
    return;
  }

  const std::string text(message);
  switch (level) {
  case log_level::error:
    log_.err(text);
    break;
  case log_level::warning:
    log_.wrn(text);
    break;
  case log_level::info:
    log_.inf(text);
    break;
  case log_level::debug:
    log_.dbg(text);
    break;
  case log_level::trace:
    log_.trc(text);
    break;
  }
}

} // namespace unw1nd::log
