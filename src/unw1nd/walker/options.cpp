#include "unw1nd/walker/options.hpp"

#include <redlog.hpp>

#include "unw1nd/walker/walker.hpp"

namespace unw1nd {

options& options::add_entry(table::unwind_entry entry) {
  table_.add(std::move(entry));
  return *this;
}

result<size_t> options::add_entries_from_eh_frame(
    int64_t bias, uint64_t stated_address, std::span<const uint8_t> bytes
) {
  const auto section = cfi::eh_frame_section::parse(bytes, stated_address);
  if (!section.ok()) {
    return error_result<size_t>(section.error);
  }
  return ok_result(add_entries_from_section(bias, *section.value));
}

size_t options::add_entries_from_section(int64_t bias, const cfi::eh_frame_section& section) {
  auto log = redlog::get_logger("unw1nd.options");

  size_t added = 0;
  size_t skipped = 0;
  section.visit_descriptors([&](const cfi::frame_descriptor& descriptor) {
    if (descriptor.length() == 0 || descriptor.common_record() == nullptr) {
      ++skipped;
      return;
    }
    auto entry = table::unwind_entry::from_descriptor(bias, descriptor);
    if (!entry.ok()) {
      ++skipped;
      return;
    }
    table_.add(std::move(entry.value));
    ++added;
  });

  if (skipped > 0) {
    log.dbg("skipped unusable frame descriptors", redlog::field("count", skipped));
  }
  log.trc("added entries from section", redlog::field("entries", added));
  return added;
}

size_t options::find_eh_frame_entries(const runtime::section_filter& filter) {
  auto log = redlog::get_logger("unw1nd.options");

  size_t total = 0;
  size_t modules = 0;
  for (const runtime::module_section& module : runtime::enumerate_eh_frame_sections(filter)) {
    const result<size_t> added = add_entries_from_eh_frame(module.bias, module.stated_address, module.eh_frame);
    if (!added.ok()) {
      log.wrn(
          "skipping module with undecodable eh_frame", redlog::field("path", module.path),
          redlog::field("error", to_string(added.error.cfi))
      );
      continue;
    }
    log.dbg("ingested module", redlog::field("path", module.path), redlog::field("entries", added.value));
    total += added.value;
    ++modules;
  }

  log.vrb("eh_frame entries found", redlog::field("modules", modules), redlog::field("entries", total));
  return total;
}

options& options::clear_entries() {
  table_.clear();
  return *this;
}

walker<> options::build() && { return walker<>(std::move(*this), memory::process_memory_reader(), log::ignore_logs()); }

} // namespace unw1nd
