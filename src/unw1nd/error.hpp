#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace unw1nd {

// unwinder error codes for structured results
enum class error_code : uint8_t {
  ok,
  decoder_error,
  invalid_tagged_word,
  no_unwind_info_for_address,
  unknown_register,
  platform_capture_failed,
  memory_read_failed,
  unsupported_expression
};

// detail for error_code::decoder_error
enum class cfi_error : uint8_t {
  none,
  malformed_section,
  missing_common_record,
  invalid_instruction,
  invalid_operand,
  cfa_rule_mismatch,
  address_out_of_order,
  remember_stack_overflow,
  remember_stack_underflow,
  restore_outside_descriptor,
  advance_in_common_record,
  context_unavailable,
  context_uninitialized
};

// trivially copyable so it can travel through a signal handler; detail is always a string literal
struct error_info {
  error_code code = error_code::ok;
  cfi_error cfi = cfi_error::none;
  uint16_t register_number = 0;
  int os_error = 0;
  uint64_t address = 0;
  const char* detail = nullptr;

  constexpr bool ok() const noexcept { return code == error_code::ok; }
};

constexpr error_info make_error(error_code code, const char* detail = nullptr) noexcept {
  error_info info{};
  info.code = code;
  info.detail = detail;
  return info;
}

constexpr error_info make_decoder_error(cfi_error cfi, const char* detail = nullptr) noexcept {
  error_info info = make_error(error_code::decoder_error, detail);
  info.cfi = cfi;
  return info;
}

constexpr error_info make_no_unwind_info(uint64_t address) noexcept {
  error_info info = make_error(error_code::no_unwind_info_for_address);
  info.address = address;
  return info;
}

constexpr error_info make_unknown_register(uint16_t register_number) noexcept {
  error_info info = make_error(error_code::unknown_register);
  info.register_number = register_number;
  return info;
}

// result carries a value and an error; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  error_info error{};

  constexpr bool ok() const noexcept { return error.ok(); }
};

template <typename T> struct is_result : std::false_type {};
template <typename T> struct is_result<result<T>> : std::true_type {};
template <typename T> inline constexpr bool is_result_v = is_result<T>::value;

template <typename T> constexpr result<T> ok_result(T value) { return result<T>{std::move(value), error_info{}}; }

template <typename T> constexpr result<T> error_result(error_info error) { return result<T>{T{}, error}; }

const char* to_string(error_code code) noexcept;
const char* to_string(cfi_error error) noexcept;

/**
 * @brief format an error into a caller-owned buffer
 * @return number of characters written, excluding the terminator
 * @note async-signal-safe, truncates instead of allocating
 */
size_t describe(const error_info& error, char* buffer, size_t size) noexcept;

} // namespace unw1nd
