#pragma once

#include <concepts>

#include "unw1nd/cfi/unwind_row.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/memory/process_memory.hpp"
#include "unw1nd/registers/unsupported_registers.hpp"
#include "unw1nd/registers/x86_registers.hpp"
#include "unw1nd/tagged_word.hpp"

namespace unw1nd::registers {

/**
 * @brief per-architecture register snapshot
 * @details exposes the three registers a frame walk needs and the transition
 * from one frame to its caller given the unwind row covering the current ip.
 */
template <typename T> concept register_set = std::default_initializable<T> && std::copyable<T> &&
    requires(const T& regs, const cfi::unwind_row& row, const memory::process_memory_reader& reader) {
  { regs.bp() } -> std::same_as<tagged_word>;
  { regs.sp() } -> std::same_as<tagged_word>;
  { regs.ip() } -> std::same_as<tagged_word>;
  { T::from_unwind_table_row(row, regs, reader) } -> std::same_as<result<T>>;
};

#if defined(__x86_64__)
using frame_registers = x86_64_frame_registers;
#elif defined(__i386__)
using frame_registers = i386_frame_registers;
#else
using frame_registers = unsupported_frame_registers;
#endif

static_assert(register_set<x86_64_frame_registers>);
static_assert(register_set<i386_frame_registers>);
static_assert(register_set<unsupported_frame_registers>);

} // namespace unw1nd::registers
