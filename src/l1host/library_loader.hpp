#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "l1host/library_registry.hpp"

namespace l1::host {

enum class load_error {
  ok,
  not_found,
  open_failed,
  base_unknown,
  register_failed,
  not_loaded
};

const char* to_string(load_error error);

struct loaded_library {
  void* handle = nullptr;
  uint64_t base_address = 0;
  std::string path;
};

struct load_result {
  loaded_library library{};
  load_error error = load_error::ok;
  std::string detail;

  bool ok() const { return error == load_error::ok; }
};

// maps shared objects with the dynamic loader and records them in a registry
class library_loader {
public:
  // with unload_on_destroy off, libraries stay mapped and registered after the loader is gone
  explicit library_loader(
      library_registry& registry = library_registry::global(), bool unload_on_destroy = true
  );
  ~library_loader();

  library_loader(const library_loader&) = delete;
  library_loader& operator=(const library_loader&) = delete;

  // name is resolved with locate_library, searching extra_paths first
  load_result load(const std::string& name, const std::vector<std::string>& extra_paths = {});
  load_error unload(void* handle);
  void unload_all();

  // address of an exported symbol in a library mapped by this loader, or null
  void* symbol(void* handle, const char* name) const;

  const std::vector<loaded_library>& loaded() const { return loaded_; }

private:
  library_registry& registry_;
  bool unload_on_destroy_ = true;
  std::vector<loaded_library> loaded_{};
};

// lowest mapped address of the object behind a dlopen handle, or zero
uint64_t mapped_base(void* handle);

} // namespace l1::host
