#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "l1host/entry_points.hpp"

namespace l1::host {

enum class registry_error {
  ok,
  invalid_base,
  invalid_name
};

const char* to_string(registry_error error);

struct registered_library {
  uint64_t base_address = 0;
  std::string name;
};

using load_notifier = void (*)(uint64_t base_address, const char* name);

// base address -> owned library name, published through jni_loader_iter_libs
class library_registry {
public:
  explicit library_registry(load_notifier notifier = &jni_loader_lib_loaded);

  library_registry(const library_registry&) = delete;
  library_registry& operator=(const library_registry&) = delete;

  // stores a copy of name (replacing any entry at base) and then announces it outside the lock
  registry_error add(uint64_t base_address, std::string_view name);
  bool remove(uint64_t base_address);
  void clear();

  // invokes callback once with records in ascending base order, also when empty
  void iterate(l1_iter_callback callback) const;
  std::vector<registered_library> snapshot() const;
  size_t size() const;

  static library_registry& global();

private:
  load_notifier notifier_ = nullptr;
  mutable std::mutex mutex_{};
  std::map<uint64_t, std::string> libraries_{};
};

} // namespace l1::host
