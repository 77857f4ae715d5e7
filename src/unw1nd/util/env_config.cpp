#include "unw1nd/util/env_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <stdexcept>

namespace unw1nd::util {

namespace {

template <typename T, typename Parse>
T parse_or_default(const std::string& variable, const std::string& value, T default_value, Parse parse) {
  try {
    size_t consumed = 0;
    const T parsed = parse(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return parsed;
  } catch (const std::exception& e) {
    redlog::get_logger("unw1nd.config")
        .wrn("failed to parse variable, using default", redlog::field("variable", variable),
             redlog::field("value", value), redlog::field("error", e.what()));
    return default_value;
  }
}

} // namespace

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::string env_config::get_env_value(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  return value ? std::string(value) : std::string();
}

std::string env_config::to_lower(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

std::string env_config::trim(const std::string& value) {
  const size_t first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return std::string();
  }
  const size_t last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  const std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }
  return parse_or_default<int>(build_env_name(name), value, default_value, [](const std::string& text, size_t* pos) {
    return std::stoi(text, pos, 0);
  });
}

template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  const std::string value = trim(get_env_value(name));
  if (value.empty()) {
    return default_value;
  }
  return parse_or_default<uint64_t>(
      build_env_name(name), value, default_value,
      [](const std::string& text, size_t* pos) { return static_cast<uint64_t>(std::stoull(text, pos, 0)); }
  );
}

std::vector<std::string> env_config::get_list(const std::string& name, char delimiter) const {
  const std::string value = get_env_value(name);
  std::vector<std::string> items;
  if (value.empty()) {
    return items;
  }

  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, delimiter)) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(std::move(item));
    }
  }
  return items;
}

} // namespace unw1nd::util
