#include "unw1nd/error.hpp"

#include "unw1nd/util/format_buffer.hpp"

namespace unw1nd {

const char* to_string(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::decoder_error:
    return "decoder_error";
  case error_code::invalid_tagged_word:
    return "invalid_tagged_word";
  case error_code::no_unwind_info_for_address:
    return "no_unwind_info_for_address";
  case error_code::unknown_register:
    return "unknown_register";
  case error_code::platform_capture_failed:
    return "platform_capture_failed";
  case error_code::memory_read_failed:
    return "memory_read_failed";
  case error_code::unsupported_expression:
    return "unsupported_expression";
  }
  return "unknown";
}

const char* to_string(cfi_error error) noexcept {
  switch (error) {
  case cfi_error::none:
    return "none";
  case cfi_error::malformed_section:
    return "malformed_section";
  case cfi_error::missing_common_record:
    return "missing_common_record";
  case cfi_error::invalid_instruction:
    return "invalid_instruction";
  case cfi_error::invalid_operand:
    return "invalid_operand";
  case cfi_error::cfa_rule_mismatch:
    return "cfa_rule_mismatch";
  case cfi_error::address_out_of_order:
    return "address_out_of_order";
  case cfi_error::remember_stack_overflow:
    return "remember_stack_overflow";
  case cfi_error::remember_stack_underflow:
    return "remember_stack_underflow";
  case cfi_error::restore_outside_descriptor:
    return "restore_outside_descriptor";
  case cfi_error::advance_in_common_record:
    return "advance_in_common_record";
  case cfi_error::context_unavailable:
    return "context_unavailable";
  case cfi_error::context_uninitialized:
    return "context_uninitialized";
  }
  return "unknown";
}

size_t describe(const error_info& error, char* buffer, size_t size) noexcept {
  util::format_buffer out(buffer, size);
  out.text(to_string(error.code));

  switch (error.code) {
  case error_code::decoder_error:
    out.text(" (").text(to_string(error.cfi)).text(")");
    break;
  case error_code::no_unwind_info_for_address:
  case error_code::memory_read_failed:
    out.text(" address=").hex(error.address);
    break;
  case error_code::unknown_register:
    out.text(" register=").unsigned_dec(error.register_number);
    break;
  default:
    break;
  }

  if (error.os_error != 0) {
    out.text(" errno=").dec(error.os_error);
  }
  if (error.detail) {
    out.text(": ").text(error.detail);
  }
  return out.size();
}

} // namespace unw1nd
