#include "l1bridge/record_decoder.hpp"

#include <cstring>
#include <utility>

#include "l1bridge/string_reader.hpp"

namespace l1::bridge {

static_assert(sizeof(uint64_t) == 8);
static_assert(sizeof(const char*) == 8, "host records carry 64-bit name pointers");

decode_result decode_records(const void* records, size_t count, const decode_limits& limits) {
  decode_result result;
  if (count == 0) {
    return result;
  }
  if (count > limits.max_records) {
    result.status = {bridge_error::invalid_record_count, "record count exceeds limit"};
    return result;
  }
  if (!records) {
    result.status = {bridge_error::invalid_record_count, "records missing for non-zero count"};
    return result;
  }

  const auto* bytes = static_cast<const unsigned char*>(records);
  result.libraries.reserve(count);

  for (size_t i = 0; i < count; ++i) {
    const unsigned char* record = bytes + i * kRecordStride;

    uint64_t base = 0;
    const char* name_ptr = nullptr;
    std::memcpy(&base, record + kRecordBaseOffset, sizeof(base));
    std::memcpy(&name_ptr, record + kRecordNameOffset, sizeof(name_ptr));

    mapped_library library;
    library.base_address = base;
    if (auto name = read_c_string(name_ptr, limits.max_name_length)) {
      library.name = std::move(*name);
    }
    result.libraries.push_back(std::move(library));
  }

  return result;
}

} // namespace l1::bridge
