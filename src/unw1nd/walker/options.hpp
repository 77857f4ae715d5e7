#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ranges>
#include <span>
#include <utility>

#include "unw1nd/cfi/eh_frame_section.hpp"
#include "unw1nd/error.hpp"
#include "unw1nd/log/unwind_logger.hpp"
#include "unw1nd/memory/memory_reader.hpp"
#include "unw1nd/memory/process_memory.hpp"
#include "unw1nd/runtime/module_sections.hpp"
#include "unw1nd/table/unwind_table.hpp"

namespace unw1nd {

template <memory::memory_reader Reader = memory::process_memory_reader, log::unwind_logger Logger = log::ignore_logs>
class walker;

/**
 * @brief accumulates unwind entries and finalizes them into a walker
 * @details everything here runs at configuration time and may allocate.
 * build() and build_with() consume the options; reconfigure() on the walker
 * gives them back.
 */
class options {
public:
  options() = default;

  options& add_entry(table::unwind_entry entry);

  template <std::ranges::input_range Range> options& add_entries(Range&& entries) {
    for (auto&& entry : entries) {
      add_entry(table::unwind_entry(std::forward<decltype(entry)>(entry)));
    }
    return *this;
  }

  /**
   * @brief decode one .eh_frame section and add an entry per frame descriptor
   * @param bias load bias of the module the section belongs to
   * @param stated_address link-time address of the section
   * @param bytes section contents
   * @return number of entries added, or the decoder error
   */
  result<size_t> add_entries_from_eh_frame(int64_t bias, uint64_t stated_address, std::span<const uint8_t> bytes);

  // same, for a section already decoded
  size_t add_entries_from_section(int64_t bias, const cfi::eh_frame_section& section);

  /**
   * @brief add entries for every loaded module's .eh_frame
   * @return number of entries added; modules that fail to decode are logged and skipped
   */
  size_t find_eh_frame_entries(const runtime::section_filter& filter = {});

  options& clear_entries();

  const table::unwind_table& table() const noexcept { return table_; }

  walker<> build() &&;

  template <memory::memory_reader Reader, log::unwind_logger Logger>
  walker<Reader, Logger> build_with(Reader reader, Logger logger) &&;

private:
  template <memory::memory_reader Reader, log::unwind_logger Logger> friend class walker;

  table::unwind_table table_;
};

} // namespace unw1nd
