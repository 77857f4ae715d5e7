#include "unw1nd/cfi/eh_frame_section.hpp"

#include <string>
#include <utility>

#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Triple.h>
#include <llvm/DebugInfo/DWARF/DWARFDataExtractor.h>
#include <llvm/DebugInfo/DWARF/DWARFDebugFrame.h>
#include <llvm/Support/Casting.h>
#include <llvm/Support/Error.h>

#include <redlog.hpp>

namespace unw1nd::cfi {

namespace {

constexpr llvm::Triple::ArchType host_arch() {
#if defined(__x86_64__)
  return llvm::Triple::x86_64;
#elif defined(__i386__)
  return llvm::Triple::x86;
#elif defined(__aarch64__)
  return llvm::Triple::aarch64;
#else
  return llvm::Triple::UnknownArch;
#endif
}

constexpr bool host_little_endian() {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
  return false;
#else
  return true;
#endif
}

} // namespace

eh_frame_section::eh_frame_section(construct_tag, std::vector<uint8_t> bytes, uint64_t stated_address)
    : bytes_(std::move(bytes)), stated_address_(stated_address),
      frame_(std::make_unique<llvm::DWARFDebugFrame>(host_arch(), true, stated_address)) {}

eh_frame_section::~eh_frame_section() = default;

result<std::shared_ptr<const eh_frame_section>> eh_frame_section::parse(std::span<const uint8_t> bytes,
                                                                        uint64_t stated_address) {
  auto log = redlog::get_logger("unw1nd.cfi");

  if (bytes.empty()) {
    log.dbg("empty eh_frame section", redlog::field("address", "0x%llx", (unsigned long long) stated_address));
    return error_result<std::shared_ptr<const eh_frame_section>>(
        make_decoder_error(cfi_error::malformed_section, "empty section")
    );
  }

  auto section = std::make_shared<eh_frame_section>(
      construct_tag{}, std::vector<uint8_t>(bytes.begin(), bytes.end()), stated_address
  );

  llvm::StringRef contents(reinterpret_cast<const char*>(section->bytes_.data()), section->bytes_.size());
  llvm::DWARFDataExtractor data(contents, host_little_endian(), static_cast<uint8_t>(sizeof(void*)));

  if (llvm::Error err = section->frame_->parse(data)) {
    log.wrn(
        "failed to decode eh_frame", redlog::field("address", "0x%llx", (unsigned long long) stated_address),
        redlog::field("size", bytes.size()), redlog::field("error", llvm::toString(std::move(err)))
    );
    return error_result<std::shared_ptr<const eh_frame_section>>(
        make_decoder_error(cfi_error::malformed_section, "eh_frame decode failed")
    );
  }

  size_t common_records = 0;
  for (const llvm::dwarf::FrameEntry& entry : section->frame_->entries()) {
    if (const auto* descriptor = llvm::dyn_cast<llvm::dwarf::FDE>(&entry)) {
      section->descriptors_.push_back(descriptor);
    } else {
      ++common_records;
    }
  }

  log.trc(
      "decoded eh_frame", redlog::field("address", "0x%llx", (unsigned long long) stated_address),
      redlog::field("descriptors", section->descriptors_.size()), redlog::field("common_records", common_records)
  );

  return ok_result<std::shared_ptr<const eh_frame_section>>(std::move(section));
}

} // namespace unw1nd::cfi
