#pragma once

#include <climits>
#include <compare>
#include <type_traits>
#include <utility>

#include "unw1nd/error.hpp"
#include "unw1nd/types.hpp"

namespace unw1nd {

/**
 * @brief a machine word that is either known or unknown
 * @details every operator is total: an unknown operand makes the result unknown,
 * known operands wrap at word width, division by zero yields unknown and shift
 * amounts are masked to the word width. nothing here can trap.
 */
class tagged_word {
public:
  constexpr tagged_word() noexcept = default;

  static constexpr tagged_word valid(word value) noexcept { return tagged_word(value, true); }
  static constexpr tagged_word invalid() noexcept { return tagged_word(); }

  // a failed read collapses to unknown instead of propagating
  static constexpr tagged_word from(const result<word>& read) noexcept {
    return read.ok() ? valid(read.value) : invalid();
  }

  constexpr bool is_valid() const noexcept { return valid_; }
  constexpr bool is_invalid() const noexcept { return !valid_; }

  // zero when unknown
  constexpr word value() const noexcept { return value_; }

  constexpr word unwrap_or(word fallback) const noexcept { return valid_ ? value_ : fallback; }

  constexpr bool is_word_aligned() const noexcept { return valid_ && value_ % sizeof(word) == 0; }

  template <typename F> constexpr tagged_word map(F&& fn) const {
    static_assert(std::is_invocable_r_v<word, F, word>, "map expects word(word)");
    return valid_ ? valid(std::forward<F>(fn)(value_)) : invalid();
  }

  template <typename U, typename F> constexpr U map_or(U fallback, F&& fn) const {
    static_assert(std::is_invocable_r_v<U, F, word>, "map_or expects U(word)");
    return valid_ ? static_cast<U>(std::forward<F>(fn)(value_)) : fallback;
  }

  template <typename F> constexpr tagged_word and_then(F&& fn) const {
    static_assert(std::is_invocable_r_v<tagged_word, F, word>, "and_then expects tagged_word(word)");
    return valid_ ? std::forward<F>(fn)(value_) : invalid();
  }

  constexpr result<word> to_result() const noexcept {
    if (!valid_) {
      return error_result<word>(make_error(error_code::invalid_tagged_word));
    }
    return ok_result(value_);
  }

  friend constexpr bool operator==(const tagged_word&, const tagged_word&) noexcept = default;

  // known words order before unknown ones
  friend constexpr std::strong_ordering operator<=>(const tagged_word& left, const tagged_word& right) noexcept {
    if (left.valid_ != right.valid_) {
      return left.valid_ ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    return left.value_ <=> right.value_;
  }

  static constexpr word shift_mask = sizeof(word) * CHAR_BIT - 1;

private:
  constexpr tagged_word(word value, bool is_valid) noexcept : value_(value), valid_(is_valid) {}

  word value_ = 0;
  bool valid_ = false;
};

namespace detail {

template <typename Op> constexpr tagged_word combine(tagged_word left, tagged_word right, Op op) noexcept {
  if (left.is_invalid() || right.is_invalid()) {
    return tagged_word::invalid();
  }
  return op(left.value(), right.value());
}

} // namespace detail

#define UNW1ND_TAGGED_WORD_OPERATOR(op, compound, body)                                                             \
  constexpr tagged_word operator op(tagged_word left, tagged_word right) noexcept {                                   \
    return detail::combine(left, right, [](word a, word b) -> tagged_word { body });                                 \
  }                                                                                                                  \
  constexpr tagged_word operator op(tagged_word left, word right) noexcept {                                          \
    return left op tagged_word::valid(right);                                                                        \
  }                                                                                                                  \
  constexpr tagged_word operator op(word left, tagged_word right) noexcept {                                          \
    return tagged_word::valid(left) op right;                                                                        \
  }                                                                                                                  \
  constexpr tagged_word& operator compound(tagged_word& left, tagged_word right) noexcept {                           \
    left = left op right;                                                                                            \
    return left;                                                                                                     \
  }                                                                                                                  \
  constexpr tagged_word& operator compound(tagged_word& left, word right) noexcept {                                  \
    left = left op right;                                                                                            \
    return left;                                                                                                     \
  }

UNW1ND_TAGGED_WORD_OPERATOR(+, +=, return tagged_word::valid(a + b);)
UNW1ND_TAGGED_WORD_OPERATOR(-, -=, return tagged_word::valid(a - b);)
UNW1ND_TAGGED_WORD_OPERATOR(*, *=, return tagged_word::valid(a * b);)
UNW1ND_TAGGED_WORD_OPERATOR(/, /=, return b == 0 ? tagged_word::invalid() : tagged_word::valid(a / b);)
UNW1ND_TAGGED_WORD_OPERATOR(%, %=, return b == 0 ? tagged_word::invalid() : tagged_word::valid(a % b);)
UNW1ND_TAGGED_WORD_OPERATOR(&, &=, return tagged_word::valid(a & b);)
UNW1ND_TAGGED_WORD_OPERATOR(|, |=, return tagged_word::valid(a | b);)
UNW1ND_TAGGED_WORD_OPERATOR(^, ^=, return tagged_word::valid(a ^ b);)
UNW1ND_TAGGED_WORD_OPERATOR(<<, <<=, return tagged_word::valid(a << (b & tagged_word::shift_mask));)
UNW1ND_TAGGED_WORD_OPERATOR(>>, >>=, return tagged_word::valid(a >> (b & tagged_word::shift_mask));)

#undef UNW1ND_TAGGED_WORD_OPERATOR

// wrapping signed displacement, as used for CFA-relative slots
constexpr tagged_word offset_by(tagged_word base, int64_t offset) noexcept {
  return base + static_cast<word>(offset);
}

} // namespace unw1nd
