#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace l1::bridge {

inline constexpr const char* kDefaultIterSymbol = "jni_loader_iter_libs";
inline constexpr const char* kDefaultLoadedSymbol = "jni_loader_lib_loaded";
inline constexpr size_t kDefaultMaxRecords = 1u << 20;
inline constexpr size_t kDefaultMaxNameLength = 4096;

// one library as reported by the host at enumeration time
struct mapped_library {
  uint64_t base_address = 0;
  std::string name;

  bool operator==(const mapped_library& other) const = default;
};

// a library the host finished mapping, delivered while the host's call is in flight
struct library_load_event {
  uint64_t base_address = 0;
  std::string name;

  bool operator==(const library_load_event& other) const = default;
};

struct entry_point {
  std::string name;
  void* address = nullptr;
  std::string module_path;
};

struct bridge_config {
  std::string iter_symbol = kDefaultIterSymbol;
  std::string loaded_symbol = kDefaultLoadedSymbol;
  // empty searches the main executable
  std::string module;
  size_t max_records = kDefaultMaxRecords;
  size_t max_name_length = kDefaultMaxNameLength;
};

enum class bridge_error {
  ok,
  capability_unavailable,
  invalid_record_count,
  hook_failed
};

struct bridge_status {
  bridge_error code = bridge_error::ok;
  const char* detail = nullptr;

  constexpr bool ok() const { return code == bridge_error::ok; }
};

struct mapped_libs_result {
  std::vector<mapped_library> libraries;
  bridge_status status{};

  bool ok() const { return status.ok(); }
};

enum class capability {
  enumerate,
  load_events
};

struct diagnostic {
  capability which = capability::enumerate;
  std::string message;
};

const char* to_string(bridge_error error);
const char* to_string(capability which);

} // namespace l1::bridge
