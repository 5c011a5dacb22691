#include "l1h00k/patcher/patcher.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/mman.h>
#include <unistd.h>

namespace l1::h00k {
namespace {

struct page_span {
  uintptr_t start = 0;
  size_t size = 0;
};

page_span pages_for(void* address, size_t size) {
  long page_value = sysconf(_SC_PAGESIZE);
  const uintptr_t page = page_value > 0 ? static_cast<uintptr_t>(page_value) : 4096;
  const auto start = reinterpret_cast<uintptr_t>(address);
  const uintptr_t first = start & ~(page - 1);
  const uintptr_t last = (start + size + page - 1) & ~(page - 1);
  return {first, static_cast<size_t>(last - first)};
}

// reads the current protection of the mapping containing address from /proc/self/maps
bool query_protection(void* address, int& prot_out) {
  FILE* maps = std::fopen("/proc/self/maps", "r");
  if (!maps) {
    return false;
  }

  char line[512];
  const auto addr = reinterpret_cast<uintptr_t>(address);
  bool found = false;
  while (std::fgets(line, sizeof(line), maps)) {
    unsigned long start = 0;
    unsigned long end = 0;
    char perms[5] = {};
    if (std::sscanf(line, "%lx-%lx %4s", &start, &end, perms) != 3) {
      continue;
    }
    if (addr < start || addr >= end) {
      continue;
    }
    int prot = PROT_NONE;
    if (perms[0] == 'r') {
      prot |= PROT_READ;
    }
    if (perms[1] == 'w') {
      prot |= PROT_WRITE;
    }
    if (perms[2] == 'x') {
      prot |= PROT_EXEC;
    }
    prot_out = prot;
    found = true;
    break;
  }
  std::fclose(maps);
  return found;
}

void flush_icache(void* address, size_t size) {
  auto* start = static_cast<char*>(address);
  __builtin___clear_cache(start, start + size);
}

} // namespace

bool code_patcher::write(void* address, const uint8_t* bytes, size_t size) {
  last_errno_ = 0;
  if (!address || !bytes || size == 0) {
    return false;
  }

  int original = PROT_READ | PROT_EXEC;
  if (!query_protection(address, original)) {
    last_errno_ = ENOENT;
    return false;
  }

  // the patched page may hold the code performing this write, so it stays executable
  const page_span span = pages_for(address, size);
  if ((original & PROT_WRITE) == 0) {
    if (mprotect(reinterpret_cast<void*>(span.start), span.size, original | PROT_WRITE | PROT_EXEC) != 0) {
      last_errno_ = errno;
      return false;
    }
  }

  std::memcpy(address, bytes, size);
  flush_icache(address, size);

  if ((original & PROT_WRITE) == 0) {
    if (mprotect(reinterpret_cast<void*>(span.start), span.size, original) != 0) {
      last_errno_ = errno;
      return false;
    }
  }
  return true;
}

bool code_patcher::restore(void* address, const uint8_t* bytes, size_t size) { return write(address, bytes, size); }

} // namespace l1::h00k
