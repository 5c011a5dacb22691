#include "l1base/env_config.hpp"

#include <cstdlib>
#include <stdexcept>

#include <redlog.hpp>

#include "l1base/string_utils.hpp"

namespace l1::util {

namespace {

auto log_env = redlog::get_logger("l1base.env");

template <typename T, typename Parse>
T parse_or_default(const std::string& env_name, const std::string& value, T default_value, const char* type_name,
                   Parse parse) {
  try {
    size_t consumed = 0;
    T parsed = parse(value, consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
    return parsed;
  } catch (const std::exception& e) {
    log_env.wrn(
        "failed to parse variable, using default", redlog::field("variable", env_name),
        redlog::field("type", type_name), redlog::field("error", e.what())
    );
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
  return value ? trim_copy(value) : std::string();
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  std::string value = get_env_value(name);
  return value.empty() ? default_value : value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }

  std::string lower_value = to_lower(value);
  if (lower_value == "1" || lower_value == "true" || lower_value == "yes" || lower_value == "on") {
    return true;
  }
  if (lower_value == "0" || lower_value == "false" || lower_value == "no" || lower_value == "off") {
    return false;
  }
  log_env.wrn(
      "failed to parse variable, using default", redlog::field("variable", build_env_name(name)),
      redlog::field("type", "bool"), redlog::field("value", value)
  );
  return default_value;
}

template <> int env_config::get<int>(const std::string& name, int default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }
  return parse_or_default<int>(build_env_name(name), value, default_value, "int", [](const std::string& text,
                                                                                     size_t& consumed) {
    return std::stoi(text, &consumed);
  });
}

template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const {
  std::string value = get_env_value(name);
  if (value.empty()) {
    return default_value;
  }
  return parse_or_default<uint64_t>(
      build_env_name(name), value, default_value, "uint64_t",
      [](const std::string& text, size_t& consumed) { return static_cast<uint64_t>(std::stoull(text, &consumed, 0)); }
  );
}

} // namespace l1::util
