#pragma once

#include <optional>

#include "l1bridge/bridge_types.hpp"

namespace l1::bridge {

// looks the name up among the module's exports; module null or empty means the main executable
std::optional<entry_point> find_entry_point(const char* name, const char* module);

} // namespace l1::bridge
