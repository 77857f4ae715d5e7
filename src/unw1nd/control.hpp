#pragma once

#include <concepts>
#include <cstdint>
#include <variant>

#include "unw1nd/error.hpp"

namespace unw1nd {

// what a walk callback wants next
enum class walk_control : uint8_t { continue_walk, break_walk };

constexpr walk_control as_walk_control(walk_control control) noexcept { return control; }

// no opinion, keep walking; this is what a void callback produces
constexpr walk_control as_walk_control(std::monostate) noexcept { return walk_control::continue_walk; }

constexpr walk_control as_walk_control(bool keep_going) noexcept {
  return keep_going ? walk_control::continue_walk : walk_control::break_walk;
}

constexpr walk_control as_walk_control(const error_info& error) noexcept {
  return error.ok() ? walk_control::continue_walk : walk_control::break_walk;
}

template <typename T> constexpr walk_control as_walk_control(const result<T>& outcome) noexcept {
  return as_walk_control(outcome.error);
}

template <typename T> concept walk_control_source = requires(const T& value) {
  { as_walk_control(value) } -> std::same_as<walk_control>;
};

} // namespace unw1nd
