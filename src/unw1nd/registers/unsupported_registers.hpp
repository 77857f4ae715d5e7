#pragma once

#include <cstdint>
#include <type_traits>

#include <ucontext.h>

#include "unw1nd/cfi/unwind_row.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/memory/memory_reader.hpp"
#include "unw1nd/tagged_word.hpp"

namespace unw1nd::registers {

// stand-in for architectures without a register binding: links, reports everything unknown, cannot start a walk
class unsupported_frame_registers {
public:
  tagged_word bp() const noexcept { return tagged_word::invalid(); }
  tagged_word sp() const noexcept { return tagged_word::invalid(); }
  tagged_word ip() const noexcept { return tagged_word::invalid(); }

  static constexpr bool tracks(uint64_t) noexcept { return false; }

  result<tagged_word> get_register(uint64_t register_number) const noexcept {
    return error_result<tagged_word>(
        make_unknown_register(register_number > UINT16_MAX ? UINT16_MAX : static_cast<uint16_t>(register_number))
    );
  }

  template <memory::memory_reader Reader>
  static result<unsupported_frame_registers> from_unwind_table_row(
      const cfi::unwind_row&, const unsupported_frame_registers&, const Reader&
  ) noexcept {
    return error_result<unsupported_frame_registers>(
        make_error(error_code::invalid_tagged_word, "no register binding for this architecture")
    );
  }

  static result<unsupported_frame_registers> from_native_context(const ucontext_t&) noexcept {
    return error_result<unsupported_frame_registers>(
        make_error(error_code::platform_capture_failed, "no register binding for this architecture")
    );
  }

  template <typename F>
  static auto with_current(F&&) -> std::invoke_result_t<F, const unsupported_frame_registers&> {
    using return_type = std::invoke_result_t<F, const unsupported_frame_registers&>;
    static_assert(is_result_v<return_type>, "with_current callback must return a result");

    return_type failed{};
    failed.error = make_error(error_code::platform_capture_failed, "no register binding for this architecture");
    return failed;
  }

  friend bool operator==(const unsupported_frame_registers&, const unsupported_frame_registers&) = default;
};

} // namespace unw1nd::registers
