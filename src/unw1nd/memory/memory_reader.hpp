#pragma once

#include <concepts>
#include <cstdint>

#include "unw1nd/error.hpp"
#include "unw1nd/types.hpp"

namespace unw1nd::memory {

/**
 * @brief fallible word-sized read capability
 * @details implementations run on the walk path, possibly inside a signal handler:
 * read must not allocate, lock or block, and must report a bad address as an
 * error rather than faulting.
 */
template <typename R> concept memory_reader = requires(const R& reader, word address) {
  { reader.read(address) } -> std::same_as<result<word>>;
};

template <typename R> concept offset_memory_reader = memory_reader<R> && requires(const R& reader, word address,
                                                                                 int64_t offset) {
  { reader.read_offset(address, offset) } -> std::same_as<result<word>>;
};

// reads address + offset with wrapping pointer arithmetic; a reader may supply its own read_offset
template <memory_reader R> result<word> read_offset(const R& reader, word address, int64_t offset) {
  if constexpr (offset_memory_reader<R>) {
    return reader.read_offset(address, offset);
  } else {
    return reader.read(address + static_cast<word>(offset));
  }
}

} // namespace unw1nd::memory
