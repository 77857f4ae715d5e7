#pragma once

#include <memory>

#include "unw1nd/error.hpp"
#include "unw1nd/types.hpp"

namespace unw1nd::memory {

/**
 * @brief reads words from the current process without faulting on bad addresses
 * @details linux uses process_vm_readv against the own pid; when the kernel
 * refuses it (seccomp, yama) the word is copied through a non-blocking pipe,
 * where an unmapped source makes write(2) fail with EFAULT. darwin uses
 * mach_vm_read_overwrite on the own task. errno is preserved across a read.
 * @note the pipe fallback is shared between copies of one reader and is not
 * safe to use from two threads at once, same as the walker itself.
 */
class process_memory_reader {
public:
  process_memory_reader();

  result<word> read(word address) const noexcept;

  bool has_pipe_fallback() const noexcept;

private:
  struct copy_pipe;

  std::shared_ptr<copy_pipe> pipe_;
};

} // namespace unw1nd::memory
