#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include <redlog.hpp>

#include "unw1nd/tagged_word.hpp"
#include "unw1nd/util/format_buffer.hpp"

namespace unw1nd::log {

enum class log_level : uint8_t { error, warning, info, debug, trace };

const char* to_string(log_level level) noexcept;

/**
 * @brief sink for messages produced while walking
 * @details the walker checks enabled() before formatting. implementations used
 * from a signal handler must not allocate or lock in write().
 */
template <typename L> concept unwind_logger = requires(const L& logger, log_level level, std::string_view message) {
  { logger.enabled(level) } -> std::convertible_to<bool>;
  logger.write(level, message);
};

// default sink: drops everything
struct ignore_logs {
  constexpr bool enabled(log_level) const noexcept { return false; }
  void write(log_level, std::string_view) const noexcept {}
};

// async-signal-safe sink writing "unw1nd[level] message" lines with write(2)
class stderr_logger {
public:
  explicit stderr_logger(log_level threshold = log_level::debug) noexcept : threshold_(threshold) {}

  bool enabled(log_level level) const noexcept { return level <= threshold_; }
  void write(log_level level, std::string_view message) const noexcept;

  log_level threshold() const noexcept { return threshold_; }

private:
  log_level threshold_;
};

// forwards to redlog; allocates, so only for walks outside signal handlers
class redlog_logger {
public:
  explicit redlog_logger(log_level threshold = log_level::debug) : threshold_(threshold) {}

  bool enabled(log_level level) const noexcept { return level <= threshold_; }
  void write(log_level level, std::string_view message) const;

private:
  log_level threshold_;
  mutable redlog::logger log_{"unw1nd.walk"};
};

static_assert(unwind_logger<ignore_logs>);
static_assert(unwind_logger<stderr_logger>);
static_assert(unwind_logger<redlog_logger>);

/**
 * @brief fixed-capacity message builder for the walk path
 * @details overlong messages are cut, never grown.
 */
template <size_t Capacity = 192> class log_line {
public:
  log_line() noexcept : out_(storage_.data(), storage_.size()) {}

  log_line(const log_line&) = delete;
  log_line& operator=(const log_line&) = delete;

  log_line& text(std::string_view value) noexcept {
    out_.text(value);
    return *this;
  }

  log_line& field(std::string_view name, uint64_t value) noexcept {
    out_.text(" ").text(name).text("=").hex(value);
    return *this;
  }

  log_line& field(std::string_view name, tagged_word value) noexcept {
    out_.text(" ").text(name).text("=");
    if (value.is_valid()) {
      out_.hex(value.value());
    } else {
      out_.text("?");
    }
    return *this;
  }

  log_line& count(std::string_view name, int64_t value) noexcept {
    out_.text(" ").text(name).text("=").dec(value);
    return *this;
  }

  std::string_view view() const noexcept { return out_.view(); }
  bool truncated() const noexcept { return out_.truncated(); }

private:
  std::array<char, Capacity> storage_{};
  util::format_buffer out_;
};

} // namespace unw1nd::log
