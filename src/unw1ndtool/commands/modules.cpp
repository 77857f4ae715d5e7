#include "modules.hpp"

#include <cstdio>
#include <iostream>

#include <redlog.hpp>

#include "unw1nd/walker/options.hpp"

namespace unw1ndtool::commands {

int modules(const modules_options& options) {
  auto log = redlog::get_logger("unw1ndtool.modules");

  const auto sections = unw1nd::runtime::enumerate_eh_frame_sections(options.common.config.to_section_filter());
  if (sections.empty()) {
    std::cout << "no eh_frame sections found" << std::endl;
    return 0;
  }

  size_t failures = 0;
  for (const auto& section : sections) {
    unw1nd::options scratch;
    const auto added = scratch.add_entries_from_eh_frame(section.bias, section.stated_address, section.eh_frame);

    char line[96];
    std::snprintf(
        line, sizeof(line), "bias=0x%012llx eh_frame=0x%08llx size=%-8zu ", static_cast<unsigned long long>(section.bias),
        static_cast<unsigned long long>(section.stated_address), section.eh_frame.size()
    );
    std::cout << line;
    if (added.ok()) {
      std::cout << "entries=" << added.value;
    } else {
      ++failures;
      std::cout << "error=" << describe_error(added.error);
      log.wrn("module failed to decode", redlog::field("path", section.path));
    }
    std::cout << " " << section.path << std::endl;
  }

  std::cout << sections.size() << " modules, " << failures << " failed" << std::endl;
  return failures == 0 ? 0 : 1;
}

} // namespace unw1ndtool::commands
