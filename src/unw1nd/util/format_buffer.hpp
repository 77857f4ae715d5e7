#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace unw1nd::util {

// appends text and integers into caller-owned storage without allocating; always nul-terminated
class format_buffer {
public:
  format_buffer(char* storage, size_t capacity) noexcept : storage_(storage), capacity_(capacity) {
    if (storage_ && capacity_ > 0) {
      storage_[0] = '\0';
    }
  }

  format_buffer& text(std::string_view value) noexcept {
    for (char c : value) {
      put(c);
    }
    return *this;
  }

  format_buffer& hex(uint64_t value) noexcept {
    static constexpr char digits[] = "0123456789abcdef";
    char scratch[16];
    size_t count = 0;
    do {
      scratch[count++] = digits[value & 0xf];
      value >>= 4;
    } while (value != 0);

    text("0x");
    while (count > 0) {
      put(scratch[--count]);
    }
    return *this;
  }

  format_buffer& dec(int64_t value) noexcept {
    uint64_t magnitude = static_cast<uint64_t>(value);
    if (value < 0) {
      put('-');
      magnitude = ~magnitude + 1;
    }
    return unsigned_dec(magnitude);
  }

  format_buffer& unsigned_dec(uint64_t value) noexcept {
    char scratch[20];
    size_t count = 0;
    do {
      scratch[count++] = static_cast<char>('0' + value % 10);
      value /= 10;
    } while (value != 0);

    while (count > 0) {
      put(scratch[--count]);
    }
    return *this;
  }

  std::string_view view() const noexcept { return std::string_view(storage_, size_); }
  size_t size() const noexcept { return size_; }
  bool truncated() const noexcept { return truncated_; }

  void clear() noexcept {
    size_ = 0;
    truncated_ = false;
    if (storage_ && capacity_ > 0) {
      storage_[0] = '\0';
    }
  }

private:
  void put(char c) noexcept {
    // last slot is reserved for the terminator
    if (!storage_ || size_ + 1 >= capacity_) {
      truncated_ = true;
      return;
    }
    storage_[size_++] = c;
    storage_[size_] = '\0';
  }

  char* storage_ = nullptr;
  size_t capacity_ = 0;
  size_t size_ = 0;
  bool truncated_ = false;
};

} // namespace unw1nd::util
