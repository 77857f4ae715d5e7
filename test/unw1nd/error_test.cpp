#include <doctest/doctest.h>

#include <array>
#include <cstring>
#include <string>

#include "unw1nd/error.hpp"

TEST_CASE("error names are stable") {
  CHECK(std::string(unw1nd::to_string(unw1nd::error_code::ok)) == "ok");
  CHECK(std::string(unw1nd::to_string(unw1nd::error_code::no_unwind_info_for_address)) ==
        "no_unwind_info_for_address");
  CHECK(std::string(unw1nd::to_string(unw1nd::cfi_error::remember_stack_underflow)) == "remember_stack_underflow");
}

TEST_CASE("result reports ok only without an error") {
  const auto ok = unw1nd::ok_result<int>(3);
  CHECK(ok.ok());
  CHECK(ok.value == 3);

  const auto failed = unw1nd::error_result<int>(unw1nd::make_unknown_register(99));
  CHECK_FALSE(failed.ok());
  CHECK(failed.value == 0);
  CHECK(failed.error.register_number == 99);
}

TEST_CASE("describe formats the payload of each kind") {
  std::array<char, 128> buffer{};

  unw1nd::describe(unw1nd::make_no_unwind_info(0x4010), buffer.data(), buffer.size());
  CHECK(std::string(buffer.data()) == "no_unwind_info_for_address address=0x4010");

  unw1nd::describe(unw1nd::make_unknown_register(17), buffer.data(), buffer.size());
  CHECK(std::string(buffer.data()) == "unknown_register register=17");

  unw1nd::describe(
      unw1nd::make_decoder_error(unw1nd::cfi_error::invalid_instruction, "bad opcode"), buffer.data(), buffer.size()
  );
  CHECK(std::string(buffer.data()) == "decoder_error (invalid_instruction): bad opcode");

  unw1nd::error_info capture = unw1nd::make_error(unw1nd::error_code::platform_capture_failed);
  capture.os_error = 22;
  unw1nd::describe(capture, buffer.data(), buffer.size());
  CHECK(std::string(buffer.data()) == "platform_capture_failed errno=22");
}

TEST_CASE("describe truncates into small buffers") {
  std::array<char, 8> buffer{};
  const size_t written = unw1nd::describe(unw1nd::make_no_unwind_info(0x4010), buffer.data(), buffer.size());
  CHECK(written == 7);
  CHECK(std::strlen(buffer.data()) == 7);
  CHECK(std::string(buffer.data()) == "no_unwi");
}
