#pragma once

#include <cstddef>
#include <cstring>

#include <cerrno>
#include <unistd.h>

namespace unw1nd::util {

/**
 * @brief write raw bytes to stderr with write(2)
 *
 * async-signal-safe: no allocation, no stdio locks. partial writes are
 * retried, EINTR is retried, any other failure drops the rest silently.
 */
inline void stderr_write(const char* message, size_t size) {
  if (!message || size == 0) {
    return;
  }

  const int saved_errno = errno;
  while (size > 0) {
    const ssize_t written = ::write(STDERR_FILENO, message, size);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    message += written;
    size -= static_cast<size_t>(written);
  }
  errno = saved_errno;
}

inline void stderr_write(const char* message) {
  if (!message) {
    return;
  }
  stderr_write(message, std::strlen(message));
}

} // namespace unw1nd::util
