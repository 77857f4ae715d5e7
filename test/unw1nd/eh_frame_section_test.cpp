#include <doctest/doctest.h>

#include <memory>
#include <type_traits>
#include <vector>

#include "cfi_fixtures.hpp"
#include "unw1nd/cfi/decode_context.hpp"
#include "unw1nd/cfi/eh_frame_section.hpp"

using unw1nd::cfi::eh_frame_section;
using unw1nd::cfi::frame_descriptor;
using unw1nd::cfi::register_rule;

namespace {

std::vector<frame_descriptor> collect(const eh_frame_section& section) {
  std::vector<frame_descriptor> out;
  section.visit_descriptors([&](const frame_descriptor& descriptor) { out.push_back(descriptor); });
  return out;
}

} // namespace

// sections only come out of parse(), already owned by a shared_ptr
static_assert(!std::is_constructible_v<eh_frame_section, std::vector<uint8_t>, uint64_t>);
static_assert(!std::is_copy_constructible_v<eh_frame_section>);

TEST_CASE("eh_frame_section decodes a compiler-shaped section") {
  const std::vector<uint8_t> bytes = unw1nd_test::sample_eh_frame();
  const auto parsed = eh_frame_section::parse(bytes, unw1nd_test::sample_section_address);
  REQUIRE(parsed.ok());
  REQUIRE(parsed.value != nullptr);

  const eh_frame_section& section = *parsed.value;
  CHECK(section.stated_address() == unw1nd_test::sample_section_address);
  CHECK(section.descriptor_count() == 1);

  const auto descriptors = collect(section);
  REQUIRE(descriptors.size() == 1);
  CHECK(descriptors[0].initial_address() == 0x1000);
  CHECK(descriptors[0].length() == 0x20);
  CHECK(descriptors[0].common_record() != nullptr);
  CHECK(descriptors[0].instruction_count() > 0);
}

TEST_CASE("eh_frame_section rows match the encoded program") {
  const auto parsed = eh_frame_section::parse(unw1nd_test::sample_eh_frame(), unw1nd_test::sample_section_address);
  REQUIRE(parsed.ok());
  const auto descriptors = collect(*parsed.value);
  REQUIRE(descriptors.size() == 1);

  unw1nd::cfi::decode_context context;
  REQUIRE(context.initialize(*descriptors[0].common_record()).ok());
  REQUIRE(context.begin(descriptors[0]).ok());

  std::vector<unw1nd::cfi::unwind_row> rows;
  unw1nd::cfi::unwind_row row{};
  for (;;) {
    const auto produced = context.next_row(row);
    REQUIRE(produced.ok());
    if (!produced.value) {
      break;
    }
    rows.push_back(row);
  }

  REQUIRE(rows.size() == 3);
  CHECK(rows[0].start_address == 0x1000);
  CHECK(rows[0].end_address == 0x1001);
  CHECK(rows[0].cfa == unw1nd::cfi::cfa_rule::register_and_offset(7, 8));
  CHECK(rows[0].rule_for(16) == register_rule::at_offset(-8));

  CHECK(rows[1].start_address == 0x1001);
  CHECK(rows[1].end_address == 0x1004);
  CHECK(rows[1].cfa == unw1nd::cfi::cfa_rule::register_and_offset(7, 16));
  CHECK(rows[1].rule_for(6) == register_rule::at_offset(-16));

  CHECK(rows[2].start_address == 0x1004);
  CHECK(rows[2].end_address == 0x1020);
  CHECK(rows[2].cfa == unw1nd::cfi::cfa_rule::register_and_offset(6, 16));
  CHECK(rows[2].rule_for(16) == register_rule::at_offset(-8));
}

TEST_CASE("eh_frame_section descriptors outlive the section handle") {
  frame_descriptor kept;
  {
    const auto parsed = eh_frame_section::parse(unw1nd_test::sample_eh_frame(), unw1nd_test::sample_section_address);
    REQUIRE(parsed.ok());
    kept = collect(*parsed.value).at(0);
  }
  CHECK_FALSE(kept.empty());
  CHECK(kept.initial_address() == 0x1000);
  CHECK(kept.common_record() != nullptr);
}

TEST_CASE("eh_frame_section reports undecodable input") {
  SUBCASE("empty") {
    const auto parsed = eh_frame_section::parse({}, 0);
    CHECK(parsed.error.code == unw1nd::error_code::decoder_error);
    CHECK(parsed.error.cfi == unw1nd::cfi_error::malformed_section);
  }

  SUBCASE("descriptor pointing at a missing common record") {
    const std::vector<uint8_t> bytes = {
        0x0c, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    };
    const auto parsed = eh_frame_section::parse(bytes, 0x4000);
    CHECK_FALSE(parsed.ok());
    CHECK(parsed.error.cfi == unw1nd::cfi_error::malformed_section);
    CHECK(parsed.value == nullptr);
  }
}

TEST_CASE("frame_descriptor default is empty") {
  const frame_descriptor empty;
  CHECK(empty.empty());
  CHECK(empty.initial_address() == 0);
  CHECK(empty.length() == 0);
  CHECK(empty.common_record() == nullptr);
  CHECK(empty.instruction_count() == 0);
}
