#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "unw1nd/cfi/decode_context.hpp"
#include "unw1nd/cfi/unwind_row.hpp"
#include "unw1nd/control.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/log/unwind_logger.hpp"
#include "unw1nd/memory/memory_reader.hpp"
#include "unw1nd/registers/registers.hpp"
#include "unw1nd/table/unwind_table.hpp"
#include "unw1nd/tagged_word.hpp"
#include "unw1nd/walker/options.hpp"

namespace unw1nd {

// what a walker decomposes into for rebuilding
template <memory::memory_reader Reader, log::unwind_logger Logger> struct walker_parts {
  options configuration;
  Reader reader;
  Logger logger;
};

// value a walk returns: whatever the callback returned last, monostate for void callbacks
template <typename Callback, typename Registers>
using walk_value_t = std::conditional_t<
    std::is_void_v<std::invoke_result_t<Callback&, const Registers&>>, std::monostate,
    std::invoke_result_t<Callback&, const Registers&>>;

/**
 * @brief steps from frame to frame using a frozen unwind table
 * @details owns the entries, the reader, the logger and one decode context
 * allocated at construction. stepping never allocates, locks or blocks as long
 * as the reader and logger don't, so a walk can run inside a signal handler.
 * not re-entrant: one walk at a time per walker.
 */
template <memory::memory_reader Reader, log::unwind_logger Logger> class walker {
public:
  using reader_type = Reader;
  using logger_type = Logger;

  walker(options configuration, Reader reader, Logger logger)
      : options_(std::move(configuration)), reader_(std::move(reader)), logger_(std::move(logger)),
        context_(std::make_unique<cfi::decode_context>()) {
    options_.table_.freeze();
  }

  walker(walker&&) noexcept = default;
  walker& operator=(walker&&) noexcept = default;
  walker(const walker&) = delete;
  walker& operator=(const walker&) = delete;

  const table::unwind_table& table() const noexcept { return options_.table(); }
  const Reader& reader() const noexcept { return reader_; }
  const Logger& logger() const noexcept { return logger_; }

  // give back the configuration, reader and logger; the walker is left empty
  walker_parts<Reader, Logger> reconfigure() && {
    return walker_parts<Reader, Logger>{std::move(options_), std::move(reader_), std::move(logger_)};
  }

  /**
   * @brief recover the caller's registers from the current frame's
   * @details locates the entry covering ip, evaluates its rows up to the one
   * covering ip and applies it. fails with no_unwind_info_for_address at the
   * oldest frame. the decode context is returned to the walker on every path.
   */
  template <registers::register_set Registers> result<Registers> walk_one(const Registers& current) {
    const tagged_word ip = current.ip();
    if (ip.is_invalid()) {
      trace("stop: unknown instruction pointer", current);
      return error_result<Registers>(make_error(error_code::invalid_tagged_word, "instruction pointer"));
    }

    const table::unwind_entry* entry = options_.table_.find(ip.value());
    if (!entry) {
      trace("stop: no entry", current);
      return error_result<Registers>(make_no_unwind_info(ip.value()));
    }

    cfi::decode_context_lease context(context_);
    if (!context) {
      return error_result<Registers>(make_decoder_error(cfi_error::context_unavailable, "decode context in use"));
    }

    const llvm::dwarf::CIE* common_record = entry->descriptor.common_record();
    if (!common_record) {
      return error_result<Registers>(make_decoder_error(cfi_error::missing_common_record));
    }

    error_info error = context->initialize(*common_record);
    if (!error.ok()) {
      return error_result<Registers>(error);
    }
    error = context->begin(entry->descriptor);
    if (!error.ok()) {
      return error_result<Registers>(error);
    }

    const uint64_t stated_ip = entry->to_stated(ip.value());
    cfi::unwind_row row{};
    for (;;) {
      const result<bool> produced = context->next_row(row);
      if (!produced.ok()) {
        return error_result<Registers>(produced.error);
      }
      if (!produced.value) {
        break;
      }
      if (row.contains(stated_ip)) {
        result<Registers> next = Registers::from_unwind_table_row(row, current, reader_);
        if (next.ok()) {
          trace("step", next.value);
        }
        return next;
      }
    }

    trace("stop: no row", current);
    return error_result<Registers>(make_no_unwind_info(ip.value()));
  }

  /**
   * @brief call callback on start, then on each caller frame, until it asks to stop
   * @details the callback's return value is read through as_walk_control. the
   * first walk_one failure ends the walk and is returned; reaching the oldest
   * frame shows up as no_unwind_info_for_address.
   * @return the callback's last value when it stopped the walk
   */
  template <registers::register_set Registers, typename Callback>
  result<walk_value_t<Callback, Registers>> walk(const Registers& start, Callback&& callback) {
    using value_type = walk_value_t<Callback, Registers>;
    static_assert(walk_control_source<value_type>, "walk callback must return void or a walk_control source");

    auto visit = [&](const Registers& frame) -> value_type {
      if constexpr (std::is_void_v<std::invoke_result_t<Callback&, const Registers&>>) {
        std::invoke(callback, frame);
        return value_type{};
      } else {
        return std::invoke(callback, frame);
      }
    };

    value_type last = visit(start);
    if (as_walk_control(last) == walk_control::break_walk) {
      return ok_result(std::move(last));
    }

    Registers current = start;
    for (;;) {
      result<Registers> next = walk_one(current);
      if (!next.ok()) {
        return error_result<value_type>(next.error);
      }
      current = next.value;

      last = visit(current);
      if (as_walk_control(last) == walk_control::break_walk) {
        return ok_result(std::move(last));
      }
    }
  }

private:
  template <typename Registers> void trace(std::string_view what, const Registers& frame) const {
    if (!logger_.enabled(log::log_level::trace)) {
      return;
    }
    log::log_line<> line;
    line.text(what).field("ip", frame.ip()).field("sp", frame.sp()).field("bp", frame.bp());
    logger_.write(log::log_level::trace, line.view());
  }

  options options_;
  Reader reader_;
  Logger logger_;
  std::unique_ptr<cfi::decode_context> context_;
};

template <memory::memory_reader Reader, log::unwind_logger Logger>
walker<Reader, Logger> options::build_with(Reader reader, Logger logger) && {
  return walker<Reader, Logger>(std::move(*this), std::move(reader), std::move(logger));
}

} // namespace unw1nd
