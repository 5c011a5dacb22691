#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace l1::host {

// one entry of the array handed to the enumeration callback
struct library_record {
  uint64_t base_address;
  const char* name;
};

static_assert(sizeof(library_record) == 16);
static_assert(offsetof(library_record, base_address) == 0);
static_assert(offsetof(library_record, name) == 8);
static_assert(std::is_standard_layout_v<library_record>);

} // namespace l1::host
