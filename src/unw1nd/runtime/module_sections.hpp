#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace unw1nd::runtime {

// the call frame section of one loaded image, as mapped in this process
struct module_section {
  std::string path;
  int64_t bias = 0;
  // link-time address of the section, for pc-relative pointers
  uint64_t stated_address = 0;
  std::span<const uint8_t> eh_frame;
};

// modules the enumerator should not report, matched by path or basename
struct section_filter {
  std::vector<std::string> skip_modules;

  bool skips(std::string_view path) const;
};

std::string_view basename_of(std::string_view path);

/**
 * @brief list the .eh_frame section of every loaded image (cold path)
 * @details images come from dl_iterate_phdr, section headers from the image file
 * read with LIEF. a section is reported only if it lies inside one of the
 * image's loaded segments, so the bytes are readable in place. images that
 * cannot be opened, such as the vdso, are skipped.
 */
std::vector<module_section> enumerate_eh_frame_sections(const section_filter& filter = {});

} // namespace unw1nd::runtime
