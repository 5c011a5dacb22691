#include "l1host/library_loader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <dlfcn.h>
#include <link.h>

#include <redlog.hpp>

#include "l1host/library_locator.hpp"

namespace l1::host {
namespace {

auto log = redlog::get_logger("l1host.loader");

struct base_query {
  uintptr_t load_bias = 0;
  const char* name = nullptr;
  uint64_t base = 0;
};

int find_base(struct dl_phdr_info* info, size_t, void* data) {
  auto* query = static_cast<base_query*>(data);
  if (static_cast<uintptr_t>(info->dlpi_addr) != query->load_bias) {
    return 0;
  }
  if (query->name && info->dlpi_name && std::strcmp(query->name, info->dlpi_name) != 0) {
    return 0;
  }

  uintptr_t low = UINTPTR_MAX;
  for (size_t i = 0; i < info->dlpi_phnum; ++i) {
    if (info->dlpi_phdr[i].p_type == PT_LOAD) {
      low = std::min(low, static_cast<uintptr_t>(info->dlpi_phdr[i].p_vaddr));
    }
  }
  if (low == UINTPTR_MAX) {
    return 0;
  }
  query->base = static_cast<uint64_t>(info->dlpi_addr + low);
  return 1;
}

} // namespace

const char* to_string(load_error error) {
  switch (error) {
  case load_error::ok:
    return "ok";
  case load_error::not_found:
    return "not_found";
  case load_error::open_failed:
    return "open_failed";
  case load_error::base_unknown:
    return "base_unknown";
  case load_error::register_failed:
    return "register_failed";
  case load_error::not_loaded:
    return "not_loaded";
  }
  return "unknown";
}

uint64_t mapped_base(void* handle) {
  if (!handle) {
    return 0;
  }
  struct link_map* map = nullptr;
  if (dlinfo(handle, RTLD_DI_LINKMAP, &map) != 0 || !map) {
    return 0;
  }

  base_query query{};
  query.load_bias = static_cast<uintptr_t>(map->l_addr);
  query.name = map->l_name;
  dl_iterate_phdr(find_base, &query);
  return query.base;
}

library_loader::library_loader(library_registry& registry, bool unload_on_destroy)
    : registry_(registry), unload_on_destroy_(unload_on_destroy) {}

library_loader::~library_loader() {
  if (unload_on_destroy_) {
    unload_all();
  } else if (!loaded_.empty()) {
    log.vrb("leaving libraries mapped", redlog::field("count", loaded_.size()));
  }
}

load_result library_loader::load(const std::string& name, const std::vector<std::string>& extra_paths) {
  load_result result{};
  result.library.path = name;

  auto located = locate_library(name, extra_paths);
  if (!located) {
    result.error = load_error::not_found;
    result.detail = "not found in library search path";
    log.err("failed to locate library", redlog::field("name", name));
    return result;
  }
  const std::string path = std::move(*located);
  result.library.path = path;

  log.vrb("loading library", redlog::field("path", path));
  void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    const char* reason = dlerror();
    result.error = load_error::open_failed;
    result.detail = reason ? reason : "dlopen failed";
    log.err("failed to load library", redlog::field("path", path), redlog::field("error", result.detail));
    return result;
  }

  const uint64_t base = mapped_base(handle);
  if (base == 0) {
    dlclose(handle);
    result.error = load_error::base_unknown;
    result.detail = "no loadable segments";
    log.err("failed to locate library base", redlog::field("path", path));
    return result;
  }

  const auto registered = registry_.add(base, path);
  if (registered != registry_error::ok) {
    dlclose(handle);
    result.error = load_error::register_failed;
    result.detail = to_string(registered);
    log.err("failed to register library", redlog::field("path", path), redlog::field("error", result.detail));
    return result;
  }

  result.library.handle = handle;
  result.library.base_address = base;
  loaded_.push_back(result.library);
  log.inf("library loaded", redlog::field("path", path), redlog::field("base", "0x%016lx", base));
  return result;
}

load_error library_loader::unload(void* handle) {
  auto it = std::find_if(loaded_.begin(), loaded_.end(), [&](const loaded_library& entry) {
    return entry.handle == handle;
  });
  if (it == loaded_.end()) {
    return load_error::not_loaded;
  }

  registry_.remove(it->base_address);
  if (dlclose(it->handle) != 0) {
    const char* reason = dlerror();
    log.wrn("dlclose failed", redlog::field("path", it->path), redlog::field("error", reason ? reason : ""));
  }
  log.vrb("library unloaded", redlog::field("path", it->path));
  loaded_.erase(it);
  return load_error::ok;
}

void* library_loader::symbol(void* handle, const char* name) const {
  if (!handle || !name) {
    return nullptr;
  }
  auto it = std::find_if(loaded_.begin(), loaded_.end(), [&](const loaded_library& entry) {
    return entry.handle == handle;
  });
  if (it == loaded_.end()) {
    return nullptr;
  }

  dlerror();
  void* address = dlsym(handle, name);
  if (!address) {
    log.dbg("symbol not found", redlog::field("path", it->path), redlog::field("symbol", name));
  }
  return address;
}

void library_loader::unload_all() {
  while (!loaded_.empty()) {
    (void) unload(loaded_.back().handle);
  }
}

} // namespace l1::host
