#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace l1::bridge {

// reads a NUL-terminated string from this process without faulting on bad pointers.
// returns nullopt for null or unreadable addresses; stops at max_len or at the first
// unreadable page.
std::optional<std::string> read_c_string(const void* address, size_t max_len);

} // namespace l1::bridge
