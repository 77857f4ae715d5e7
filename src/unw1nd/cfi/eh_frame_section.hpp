#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <vector>

#include "unw1nd/cfi/frame_descriptor.hpp"
#include "unw1nd/error.hpp"

namespace llvm {
class DWARFDebugFrame;
} // namespace llvm

namespace unw1nd::cfi {

/**
 * @brief a decoded .eh_frame section for the host architecture
 * @details decoding allocates and must happen at configuration time. the raw
 * bytes are copied so expression operands stay readable after the caller's
 * buffer goes away. descriptors handed out keep the section alive.
 */
class eh_frame_section : public std::enable_shared_from_this<eh_frame_section> {
  // only parse() can name this, so sections always live in a shared_ptr
  struct construct_tag {
    explicit construct_tag() = default;
  };

public:
  eh_frame_section(construct_tag, std::vector<uint8_t> bytes, uint64_t stated_address);
  ~eh_frame_section();

  eh_frame_section(const eh_frame_section&) = delete;
  eh_frame_section& operator=(const eh_frame_section&) = delete;

  /**
   * @brief decode a whole section
   * @param bytes section contents
   * @param stated_address link-time address of the section, used for pc-relative pointers
   */
  static result<std::shared_ptr<const eh_frame_section>> parse(std::span<const uint8_t> bytes,
                                                               uint64_t stated_address);

  uint64_t stated_address() const noexcept { return stated_address_; }
  size_t descriptor_count() const noexcept { return descriptors_.size(); }

  // visits every frame description entry in section order, common records are skipped
  template <typename Visitor> void visit_descriptors(Visitor&& visitor) const {
    static_assert(std::is_invocable_v<Visitor, const frame_descriptor&>, "visitor must accept frame_descriptor");
    auto self = shared_from_this();
    for (const llvm::dwarf::FDE* entry : descriptors_) {
      visitor(frame_descriptor(std::shared_ptr<const llvm::dwarf::FDE>(self, entry)));
    }
  }

private:
  std::vector<uint8_t> bytes_;
  uint64_t stated_address_ = 0;
  std::unique_ptr<llvm::DWARFDebugFrame> frame_;
  std::vector<const llvm::dwarf::FDE*> descriptors_;
};

} // namespace unw1nd::cfi
