#include "l1host/library_registry.hpp"

#include <redlog.hpp>

namespace l1::host {
namespace {

auto log = redlog::get_logger("l1host.registry");

} // namespace

const char* to_string(registry_error error) {
  switch (error) {
  case registry_error::ok:
    return "ok";
  case registry_error::invalid_base:
    return "invalid_base";
  case registry_error::invalid_name:
    return "invalid_name";
  }
  return "unknown";
}

library_registry::library_registry(load_notifier notifier) : notifier_(notifier) {}

registry_error library_registry::add(uint64_t base_address, std::string_view name) {
  if (base_address == 0) {
    log.wrn("rejecting library without base address", redlog::field("name", std::string(name)));
    return registry_error::invalid_base;
  }
  if (name.find('\0') != std::string_view::npos) {
    log.wrn("rejecting library name with embedded nul", redlog::field("base", "0x%016lx", base_address));
    return registry_error::invalid_name;
  }

  std::string announced(name);
  {
    std::lock_guard lock(mutex_);
    libraries_[base_address] = announced;
  }

  log.dbg("library registered", redlog::field("base", "0x%016lx", base_address), redlog::field("name", announced));

  if (notifier_) {
    notifier_(base_address, announced.c_str());
  }
  return registry_error::ok;
}

bool library_registry::remove(uint64_t base_address) {
  std::lock_guard lock(mutex_);
  const bool removed = libraries_.erase(base_address) != 0;
  if (removed) {
    log.dbg("library unregistered", redlog::field("base", "0x%016lx", base_address));
  }
  return removed;
}

void library_registry::clear() {
  std::lock_guard lock(mutex_);
  libraries_.clear();
}

void library_registry::iterate(l1_iter_callback callback) const {
  if (!callback) {
    return;
  }

  // names are copied out so the callback runs without the lock
  const auto libraries = snapshot();
  std::vector<library_record> records;
  records.reserve(libraries.size());
  for (const auto& library : libraries) {
    records.push_back(library_record{library.base_address, library.name.c_str()});
  }

  log.ped("publishing library records", redlog::field("count", records.size()));
  callback(records.data(), records.size());
}

std::vector<registered_library> library_registry::snapshot() const {
  std::lock_guard lock(mutex_);
  std::vector<registered_library> out;
  out.reserve(libraries_.size());
  for (const auto& [base, name] : libraries_) {
    out.push_back(registered_library{base, name});
  }
  return out;
}

size_t library_registry::size() const {
  std::lock_guard lock(mutex_);
  return libraries_.size();
}

library_registry& library_registry::global() {
  static library_registry registry{};
  return registry;
}

} // namespace l1::host
