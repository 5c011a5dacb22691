#include "l1bridge/string_reader.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>

#include <sys/types.h>
#include <sys/uio.h>
#include <unistd.h>

namespace l1::bridge {

namespace {

constexpr size_t kChunkSize = 256;

size_t page_size() {
  static const size_t size = [] {
    long value = sysconf(_SC_PAGESIZE);
    return value > 0 ? static_cast<size_t>(value) : size_t{4096};
  }();
  return size;
}

// copies up to size bytes; never crosses a page boundary so a short read means unmapped memory
ssize_t read_self(uintptr_t address, void* out, size_t size) {
  iovec local{out, size};
  iovec remote{reinterpret_cast<void*>(address), size};
  return process_vm_readv(getpid(), &local, 1, &remote, 1, 0);
}

} // namespace

std::optional<std::string> read_c_string(const void* address, size_t max_len) {
  if (!address) {
    return std::nullopt;
  }

  std::string out;
  std::array<char, kChunkSize> buffer{};
  uintptr_t cursor = reinterpret_cast<uintptr_t>(address);
  const size_t page = page_size();
  bool first = true;

  while (out.size() < max_len) {
    size_t page_left = page - (cursor % page);
    size_t want = std::min({buffer.size(), page_left, max_len - out.size()});

    ssize_t got = read_self(cursor, buffer.data(), want);
    if (got <= 0) {
      if (first) {
        return std::nullopt;
      }
      break;
    }
    first = false;

    size_t count = static_cast<size_t>(got);
    const void* terminator = std::memchr(buffer.data(), '\0', count);
    if (terminator) {
      out.append(buffer.data(), static_cast<const char*>(terminator) - buffer.data());
      return out;
    }

    out.append(buffer.data(), count);
    cursor += count;
  }

  return out;
}

} // namespace l1::bridge
