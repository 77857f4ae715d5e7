#include "rows.hpp"

#include <cstdio>
#include <iostream>
#include <string>

#include <redlog.hpp>

#include "unw1nd/cfi/decode_context.hpp"
#include "unw1nd/walker/walker.hpp"

namespace unw1ndtool::commands {

namespace {

std::string describe_rule(const unw1nd::cfi::register_rule& rule) {
  using unw1nd::cfi::rule_kind;
  switch (rule.kind) {
  case rule_kind::unspecified:
    return "unspecified";
  case rule_kind::undefined:
    return "undefined";
  case rule_kind::same_value:
    return "same";
  case rule_kind::offset:
    return "[cfa" + std::string(rule.offset < 0 ? "" : "+") + std::to_string(rule.offset) + "]";
  case rule_kind::val_offset:
    return "cfa" + std::string(rule.offset < 0 ? "" : "+") + std::to_string(rule.offset);
  case rule_kind::register_copy:
    return "r" + std::to_string(rule.register_number);
  case rule_kind::expression:
    return "expr";
  case rule_kind::val_expression:
    return "val_expr";
  case rule_kind::architectural:
    return "arch";
  }
  return "?";
}

std::string describe_cfa(const unw1nd::cfi::cfa_rule& cfa) {
  if (cfa.kind == unw1nd::cfi::cfa_kind::expression) {
    return "expr";
  }
  return "r" + std::to_string(cfa.register_number) + (cfa.offset < 0 ? "" : "+") + std::to_string(cfa.offset);
}

} // namespace

int rows(const rows_options& options) {
  auto log = redlog::get_logger("unw1ndtool.rows");

  const uint64_t address = options.address != 0 ? options.address : reinterpret_cast<uintptr_t>(&rows);

  unw1nd::options configuration;
  configuration.find_eh_frame_entries(options.common.config.to_section_filter());
  const auto walker = std::move(configuration).build();

  const unw1nd::table::unwind_entry* entry = walker.table().find(address);
  if (!entry) {
    std::cerr << "error: no unwind entry covers 0x" << std::hex << address << std::dec << std::endl;
    return 1;
  }

  char header[128];
  std::snprintf(
      header, sizeof(header), "entry [0x%llx, 0x%llx) bias=0x%llx instructions=%zu",
      static_cast<unsigned long long>(entry->range.start), static_cast<unsigned long long>(entry->range.end),
      static_cast<unsigned long long>(entry->bias), entry->descriptor.instruction_count()
  );
  std::cout << header << std::endl;

  const auto* common_record = entry->descriptor.common_record();
  if (!common_record) {
    std::cerr << "error: entry has no common record" << std::endl;
    return 1;
  }

  unw1nd::cfi::decode_context context;
  auto error = context.initialize(*common_record);
  if (error.ok()) {
    error = context.begin(entry->descriptor);
  }
  if (!error.ok()) {
    log.err("failed to start row evaluation", redlog::field("error", describe_error(error)));
    std::cerr << "error: " << describe_error(error) << std::endl;
    return 1;
  }

  const uint64_t stated = entry->to_stated(address);
  unw1nd::cfi::unwind_row row{};
  for (;;) {
    const auto produced = context.next_row(row);
    if (!produced.ok()) {
      std::cerr << "error: " << describe_error(produced.error) << std::endl;
      return 1;
    }
    if (!produced.value) {
      break;
    }

    char range[64];
    std::snprintf(
        range, sizeof(range), "%c 0x%llx-0x%llx", row.contains(stated) ? '>' : ' ',
        static_cast<unsigned long long>(row.start_address + entry->bias),
        static_cast<unsigned long long>(row.end_address + entry->bias)
    );
    std::cout << range << " cfa=" << describe_cfa(row.cfa);
    for (size_t reg = 0; reg < unw1nd::cfi::max_tracked_registers; ++reg) {
      if (row.rules[reg].kind != unw1nd::cfi::rule_kind::unspecified) {
        std::cout << " r" << reg << "=" << describe_rule(row.rules[reg]);
      }
    }
    std::cout << std::endl;
  }
  return 0;
}

} // namespace unw1ndtool::commands
