#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace l1::util {

// reads typed settings from PREFIX_NAME environment variables
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  bool has(const std::string& name) const { return !get_env_value(name).empty(); }
  std::string env_name(const std::string& name) const { return build_env_name(name); }

private:
  std::string prefix_;
  std::string build_env_name(const std::string& name) const;
  std::string get_env_value(const std::string& name) const;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> int env_config::get<int>(const std::string& name, int default_value) const;
template <> uint64_t env_config::get<uint64_t>(const std::string& name, uint64_t default_value) const;

} // namespace l1::util
