#include "unw1nd/runtime/module_sections.hpp"

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>

#include <LIEF/ELF.hpp>
#include <redlog.hpp>

#if defined(__linux__)
#include <link.h>
#include <unistd.h>
#endif

#include "unw1nd/types.hpp"

namespace unw1nd::runtime {

namespace {

#if defined(__linux__)

struct loaded_image {
  std::string path;
  int64_t bias = 0;
  std::vector<address_range> segments;
};

std::string resolve_main_path() {
  char buffer[4096] = {};
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len <= 0) {
    return {};
  }
  buffer[len] = '\0';
  return std::string(buffer);
}

std::vector<loaded_image> snapshot_images() {
  std::vector<loaded_image> images;
  dl_iterate_phdr(
      [](struct dl_phdr_info* info, size_t, void* data) -> int {
        auto* out = static_cast<std::vector<loaded_image>*>(data);
        loaded_image image{};
        image.bias = static_cast<int64_t>(info->dlpi_addr);
        if (info->dlpi_name && info->dlpi_name[0] != '\0') {
          image.path = info->dlpi_name;
        }
        for (size_t i = 0; i < info->dlpi_phnum; ++i) {
          const ElfW(Phdr)& phdr = info->dlpi_phdr[i];
          if (phdr.p_type != PT_LOAD || phdr.p_memsz == 0) {
            continue;
          }
          image.segments.push_back(address_range{phdr.p_vaddr, phdr.p_vaddr + phdr.p_memsz});
        }
        out->push_back(std::move(image));
        return 0;
      },
      &images
  );

  // the main program comes first and is reported with an empty name
  if (!images.empty() && images.front().path.empty()) {
    images.front().path = resolve_main_path();
  }
  return images;
}

bool inside_loaded_segment(const loaded_image& image, uint64_t start, uint64_t size) {
  const uint64_t end = start + size;
  if (end < start) {
    return false;
  }
  return std::any_of(image.segments.begin(), image.segments.end(), [&](const address_range& segment) {
    return start >= segment.start && end <= segment.end;
  });
}

#endif

} // namespace

bool section_filter::skips(std::string_view path) const {
  const std::string_view base = basename_of(path);
  return std::any_of(skip_modules.begin(), skip_modules.end(), [&](const std::string& skip) {
    return skip == path || skip == base;
  });
}

std::string_view basename_of(std::string_view path) {
  const size_t slash = path.find_last_of('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::vector<module_section> enumerate_eh_frame_sections(const section_filter& filter) {
  auto log = redlog::get_logger("unw1nd.modules");
  std::vector<module_section> sections;

#if defined(__linux__)
  const std::vector<loaded_image> images = snapshot_images();
  log.dbg("enumerated loaded images", redlog::field("count", images.size()));

  for (const loaded_image& image : images) {
    if (image.path.empty() || image.path.front() != '/') {
      log.dbg("skipping image without a file", redlog::field("name", image.path));
      continue;
    }
    if (filter.skips(image.path)) {
      log.vrb("skipping filtered image", redlog::field("path", image.path));
      continue;
    }

    std::unique_ptr<LIEF::ELF::Binary> elf;
    try {
      elf = LIEF::ELF::Parser::parse(image.path);
    } catch (const std::exception& e) {
      log.dbg("failed to parse image", redlog::field("path", image.path), redlog::field("error", e.what()));
      continue;
    }
    if (!elf) {
      log.dbg("failed to parse image", redlog::field("path", image.path));
      continue;
    }

    bool found = false;
    for (const LIEF::ELF::Section& section : elf->sections()) {
      if (section.name() != ".eh_frame") {
        continue;
      }
      found = true;

      const uint64_t address = section.virtual_address();
      const uint64_t size = section.size();
      if (address == 0 || size == 0) {
        log.dbg("eh_frame not allocated", redlog::field("path", image.path));
        break;
      }
      if (!inside_loaded_segment(image, address, size)) {
        log.dbg(
            "eh_frame outside loaded segments", redlog::field("path", image.path),
            redlog::field("address", "0x%llx", (unsigned long long) address)
        );
        break;
      }

      module_section out{};
      out.path = image.path;
      out.bias = image.bias;
      out.stated_address = address;
      const auto* bytes = reinterpret_cast<const uint8_t*>(static_cast<uintptr_t>(address + image.bias));
      out.eh_frame = std::span<const uint8_t>(bytes, static_cast<size_t>(size));
      log.trc(
          "found eh_frame", redlog::field("path", out.path), redlog::field("bias", "0x%llx", (unsigned long long) out.bias),
          redlog::field("size", size)
      );
      sections.push_back(std::move(out));
      break;
    }

    if (!found) {
      log.dbg("image has no eh_frame", redlog::field("path", image.path));
    }
  }
#else
  (void) filter;
  log.wrn("module enumeration is not implemented on this platform");
#endif

  log.vrb("eh_frame sections located", redlog::field("count", sections.size()));
  return sections;
}

} // namespace unw1nd::runtime
