#pragma once

#include <cstdint>
#include <utility>

#include "unw1nd/cfi/frame_descriptor.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/types.hpp"
#include "unw1nd/util/interval.hpp"

namespace unw1nd::table {

// one frame descriptor placed at its runtime addresses
struct unwind_entry {
  address_range range{};
  int64_t bias = 0;
  cfi::frame_descriptor descriptor{};

  bool contains(uint64_t address) const noexcept { return util::range_contains(range, address); }

  // link-time address corresponding to a runtime address inside this entry
  uint64_t to_stated(uint64_t address) const noexcept { return address - static_cast<uint64_t>(bias); }

  /**
   * @brief place a descriptor at [initial + bias, initial + length + bias)
   * @return decoder error when the relocated range wraps the address space
   */
  static result<unwind_entry> from_descriptor(int64_t bias, cfi::frame_descriptor descriptor) {
    unwind_entry entry{};
    if (!util::relocate_range(descriptor.initial_address(), descriptor.length(), bias, &entry.range)) {
      return error_result<unwind_entry>(make_decoder_error(cfi_error::malformed_section, "descriptor range wraps"));
    }
    entry.bias = bias;
    entry.descriptor = std::move(descriptor);
    return ok_result(std::move(entry));
  }
};

} // namespace unw1nd::table
