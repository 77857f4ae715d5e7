#include "unw1nd/memory/process_memory.hpp"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/uio.h>
#elif defined(__APPLE__)
#include <mach/mach.h>
#include <mach/mach_vm.h>
#endif

namespace unw1nd::memory {

namespace {

error_info read_failure(word address, int os_error, const char* detail) {
  error_info error = make_error(error_code::memory_read_failed, detail);
  error.address = address;
  error.os_error = os_error;
  return error;
}

class errno_guard {
public:
  errno_guard() : saved_(errno) {}
  ~errno_guard() { errno = saved_; }

  errno_guard(const errno_guard&) = delete;
  errno_guard& operator=(const errno_guard&) = delete;

private:
  int saved_;
};

} // namespace

struct process_memory_reader::copy_pipe {
  int read_fd = -1;
  int write_fd = -1;

  copy_pipe() {
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0) {
      return;
    }
    for (int fd : fds) {
      ::fcntl(fd, F_SETFD, FD_CLOEXEC);
      ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }
    read_fd = fds[0];
    write_fd = fds[1];
  }

  ~copy_pipe() {
    if (read_fd >= 0) {
      ::close(read_fd);
    }
    if (write_fd >= 0) {
      ::close(write_fd);
    }
  }

  copy_pipe(const copy_pipe&) = delete;
  copy_pipe& operator=(const copy_pipe&) = delete;

  bool usable() const noexcept { return read_fd >= 0 && write_fd >= 0; }

  // the kernel copies from the source address on our behalf and reports EFAULT instead of signalling
  result<word> copy(word address) const noexcept {
    word value = 0;
    const ssize_t written = ::write(write_fd, reinterpret_cast<const void*>(address), sizeof(value));
    if (written != static_cast<ssize_t>(sizeof(value))) {
      const int os_error = written < 0 ? errno : EIO;
      drain();
      return error_result<word>(read_failure(address, os_error, "pipe copy rejected"));
    }

    const ssize_t received = ::read(read_fd, &value, sizeof(value));
    if (received != static_cast<ssize_t>(sizeof(value))) {
      const int os_error = received < 0 ? errno : EIO;
      drain();
      return error_result<word>(read_failure(address, os_error, "pipe drain failed"));
    }
    return ok_result(value);
  }

  void drain() const noexcept {
    char scratch[64];
    while (::read(read_fd, scratch, sizeof(scratch)) > 0) {
    }
  }
};

process_memory_reader::process_memory_reader() {
  auto pipe = std::make_shared<copy_pipe>();
  if (pipe->usable()) {
    pipe_ = std::move(pipe);
  }
}

bool process_memory_reader::has_pipe_fallback() const noexcept { return pipe_ != nullptr; }

result<word> process_memory_reader::read(word address) const noexcept {
  if (address == 0) {
    return error_result<word>(read_failure(address, EFAULT, "null address"));
  }

  errno_guard guard;

#if defined(__linux__)
  word value = 0;
  iovec local{&value, sizeof(value)};
  iovec remote{reinterpret_cast<void*>(address), sizeof(value)};
  const ssize_t copied = ::process_vm_readv(::getpid(), &local, 1, &remote, 1, 0);
  if (copied == static_cast<ssize_t>(sizeof(value))) {
    return ok_result(value);
  }

  const int os_error = copied < 0 ? errno : EFAULT;
  if ((os_error == ENOSYS || os_error == EPERM) && pipe_) {
    return pipe_->copy(address);
  }
  return error_result<word>(read_failure(address, os_error, "process_vm_readv failed"));
#elif defined(__APPLE__)
  word value = 0;
  mach_vm_size_t read_size = sizeof(value);
  const kern_return_t kr = mach_vm_read_overwrite(
      mach_task_self(), static_cast<mach_vm_address_t>(address), sizeof(value),
      reinterpret_cast<mach_vm_address_t>(&value), &read_size
  );
  if (kr != KERN_SUCCESS || read_size != sizeof(value)) {
    return error_result<word>(read_failure(address, kr, "mach_vm_read_overwrite failed"));
  }
  return ok_result(value);
#else
  if (!pipe_) {
    return error_result<word>(read_failure(address, ENOSYS, "no fault-free read primitive"));
  }
  return pipe_->copy(address);
#endif
}

} // namespace unw1nd::memory
