#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "l1bridge/bridge_types.hpp"

namespace l1::bridge {

// host record layout: { uint64_t base; const char* name; } packed to 16 bytes
inline constexpr size_t kRecordStride = 16;
inline constexpr size_t kRecordBaseOffset = 0;
inline constexpr size_t kRecordNameOffset = 8;

struct decode_limits {
  size_t max_records = kDefaultMaxRecords;
  size_t max_name_length = kDefaultMaxNameLength;
};

struct decode_result {
  std::vector<mapped_library> libraries;
  bridge_status status{};
};

// copies every record out of a host-owned array; null or unreadable names become ""
decode_result decode_records(const void* records, size_t count, const decode_limits& limits);

} // namespace l1::bridge
