#pragma once

#include <cerrno>
#include <cstdint>
#include <type_traits>
#include <utility>

#include <ucontext.h>

#include "unw1nd/cfi/unwind_row.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/memory/memory_reader.hpp"
#include "unw1nd/registers/native_context.hpp"
#include "unw1nd/tagged_word.hpp"

namespace unw1nd::registers {

// dwarf register numbers from the x86-64 psABI
struct x86_64_numbering {
  static constexpr uint16_t bp = 6;
  static constexpr uint16_t sp = 7;
  static constexpr uint16_t ip = 16;
  static constexpr const char* name = "x86_64";
#if defined(__x86_64__)
  static constexpr bool native = true;
#else
  static constexpr bool native = false;
#endif
};

// dwarf register numbers from the i386 psABI
struct i386_numbering {
  static constexpr uint16_t bp = 5;
  static constexpr uint16_t sp = 4;
  static constexpr uint16_t ip = 8;
  static constexpr const char* name = "i386";
#if defined(__i386__)
  static constexpr bool native = true;
#else
  static constexpr bool native = false;
#endif
};

/**
 * @brief frame pointer, stack pointer and return address of one frame
 * @details instances are never updated in place; the next frame is derived
 * from an unwind row with from_unwind_table_row.
 */
template <typename Numbering> class x86_frame_registers {
public:
  using numbering = Numbering;

  x86_frame_registers() = default;
  x86_frame_registers(tagged_word bp, tagged_word sp, tagged_word ip) : bp_(bp), sp_(sp), ip_(ip) {}

  tagged_word bp() const noexcept { return bp_; }
  tagged_word sp() const noexcept { return sp_; }
  tagged_word ip() const noexcept { return ip_; }

  static constexpr bool tracks(uint64_t register_number) noexcept {
    return register_number == numbering::bp || register_number == numbering::sp || register_number == numbering::ip;
  }

  result<tagged_word> get_register(uint64_t register_number) const noexcept {
    if (register_number == numbering::bp) {
      return ok_result(bp_);
    }
    if (register_number == numbering::sp) {
      return ok_result(sp_);
    }
    if (register_number == numbering::ip) {
      return ok_result(ip_);
    }
    return error_result<tagged_word>(make_unknown_register(clamp(register_number)));
  }

  /**
   * @brief derive the caller's registers from the row covering this frame's ip
   * @details the cfa is register + offset and is not itself dereferenced.
   * rules left unspecified follow the psABI: the stack pointer becomes the cfa,
   * the frame pointer is preserved and anything else is unknown.
   */
  template <memory::memory_reader Reader>
  static result<x86_frame_registers> from_unwind_table_row(
      const cfi::unwind_row& row, const x86_frame_registers& old, const Reader& reader
  ) noexcept {
    if (row.cfa.kind != cfi::cfa_kind::register_and_offset) {
      return error_result<x86_frame_registers>(
          make_error(error_code::unsupported_expression, "cfa expression evaluation")
      );
    }

    const result<tagged_word> base = old.get_register(row.cfa.register_number);
    if (!base.ok()) {
      return error_result<x86_frame_registers>(base.error);
    }
    if (base.value.is_invalid()) {
      return error_result<x86_frame_registers>(make_error(error_code::invalid_tagged_word, "cfa base register"));
    }
    const tagged_word cfa = offset_by(base.value, row.cfa.offset);

    const result<tagged_word> bp = recover(numbering::bp, row, cfa, old, reader);
    if (!bp.ok()) {
      return error_result<x86_frame_registers>(bp.error);
    }
    const result<tagged_word> sp = recover(numbering::sp, row, cfa, old, reader);
    if (!sp.ok()) {
      return error_result<x86_frame_registers>(sp.error);
    }
    const result<tagged_word> ip = recover(numbering::ip, row, cfa, old, reader);
    if (!ip.ok()) {
      return error_result<x86_frame_registers>(ip.error);
    }

    return ok_result(x86_frame_registers(bp.value, sp.value, ip.value));
  }

  // registers from a getcontext result or a signal handler's ucontext
  static result<x86_frame_registers> from_native_context(const ucontext_t& context) noexcept {
    if constexpr (!numbering::native) {
      (void) context;
      return error_result<x86_frame_registers>(
          make_error(error_code::platform_capture_failed, "not the host architecture")
      );
    } else {
      word bp = 0;
      word sp = 0;
      word ip = 0;
      if (!read_native_frame(context, bp, sp, ip)) {
        return error_result<x86_frame_registers>(
            make_error(error_code::platform_capture_failed, "unknown machine context layout")
        );
      }
      return ok_result(x86_frame_registers(tagged_word::valid(bp), tagged_word::valid(sp), tagged_word::valid(ip)));
    }
  }

  /**
   * @brief capture the calling context and hand it to fn
   * @details the captured frame is this function's own, which stays live while
   * fn runs. fn must return a result<T>; capture failures are returned in that shape.
   */
  template <typename F> static auto with_current(F&& fn) -> std::invoke_result_t<F, const x86_frame_registers&> {
    using return_type = std::invoke_result_t<F, const x86_frame_registers&>;
    static_assert(is_result_v<return_type>, "with_current callback must return a result");

    return_type failed{};
    if constexpr (!numbering::native) {
      failed.error = make_error(error_code::platform_capture_failed, "not the host architecture");
      return failed;
    } else {
      ucontext_t context;
      if (::getcontext(&context) != 0) {
        failed.error = make_error(error_code::platform_capture_failed, "getcontext failed");
        failed.error.os_error = errno;
        return failed;
      }

      const result<x86_frame_registers> captured = from_native_context(context);
      if (!captured.ok()) {
        failed.error = captured.error;
        return failed;
      }
      return std::forward<F>(fn)(captured.value);
    }
  }

  friend bool operator==(const x86_frame_registers&, const x86_frame_registers&) = default;

private:
  static uint16_t clamp(uint64_t register_number) noexcept {
    return register_number > UINT16_MAX ? UINT16_MAX : static_cast<uint16_t>(register_number);
  }

  template <memory::memory_reader Reader>
  static result<tagged_word> recover(
      uint16_t register_number, const cfi::unwind_row& row, tagged_word cfa, const x86_frame_registers& old,
      const Reader& reader
  ) noexcept {
    const cfi::register_rule rule = row.rule_for(register_number);
    switch (rule.kind) {
    case cfi::rule_kind::unspecified:
      if (register_number == numbering::sp) {
        return ok_result(cfa);
      }
      if (register_number == numbering::bp) {
        return ok_result(old.bp_);
      }
      return ok_result(tagged_word::invalid());
    case cfi::rule_kind::undefined:
    case cfi::rule_kind::architectural:
      return ok_result(tagged_word::invalid());
    case cfi::rule_kind::same_value:
      return old.get_register(register_number);
    case cfi::rule_kind::offset:
      if (cfa.is_invalid()) {
        return ok_result(tagged_word::invalid());
      }
      return ok_result(tagged_word::from(memory::read_offset(reader, cfa.value(), rule.offset)));
    case cfi::rule_kind::val_offset:
      return ok_result(offset_by(cfa, rule.offset));
    case cfi::rule_kind::register_copy:
      // an alias the binding does not track degrades to unknown
      if (!tracks(rule.register_number)) {
        return ok_result(tagged_word::invalid());
      }
      return old.get_register(rule.register_number);
    case cfi::rule_kind::expression:
    case cfi::rule_kind::val_expression: {
      error_info error = make_error(error_code::unsupported_expression, "register rule expression");
      error.register_number = register_number;
      return error_result<tagged_word>(error);
    }
    }
    return ok_result(tagged_word::invalid());
  }

  tagged_word bp_{};
  tagged_word sp_{};
  tagged_word ip_{};
};

using x86_64_frame_registers = x86_frame_registers<x86_64_numbering>;
using i386_frame_registers = x86_frame_registers<i386_numbering>;

} // namespace unw1nd::registers
