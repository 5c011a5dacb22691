#include "l1h00k/memory/memory.hpp"

#include <cstdint>

#include <sys/mman.h>
#include <unistd.h>

namespace l1::h00k::memory {
namespace {

constexpr int kExecProt = PROT_READ | PROT_WRITE | PROT_EXEC;
constexpr int kExecFlags = MAP_PRIVATE | MAP_ANONYMOUS;

size_t align_up(size_t value, size_t alignment) {
  if (alignment == 0) {
    return value;
  }
  const size_t mask = alignment - 1;
  return (value + mask) & ~mask;
}

uintptr_t align_down(uintptr_t value, size_t alignment) {
  if (alignment == 0) {
    return value;
  }
  return value & ~static_cast<uintptr_t>(alignment - 1);
}

void* map_at(uintptr_t hint, size_t size, uintptr_t lowest, uintptr_t highest_start) {
#if defined(MAP_FIXED_NOREPLACE)
  void* addr = mmap(reinterpret_cast<void*>(hint), size, kExecProt, kExecFlags | MAP_FIXED_NOREPLACE, -1, 0);
#else
  void* addr = mmap(reinterpret_cast<void*>(hint), size, kExecProt, kExecFlags, -1, 0);
#endif
  if (addr == MAP_FAILED) {
    return nullptr;
  }
  // older kernels treat MAP_FIXED_NOREPLACE as a plain hint
  const auto placed = reinterpret_cast<uintptr_t>(addr);
  if (placed < lowest || placed > highest_start) {
    munmap(addr, size);
    return nullptr;
  }
  return addr;
}

} // namespace

size_t page_size() {
  long size = sysconf(_SC_PAGESIZE);
  if (size <= 0) {
    return 4096;
  }
  return static_cast<size_t>(size);
}

exec_block allocate_executable(size_t size) {
  if (size == 0) {
    return {};
  }

  const size_t aligned = align_up(size, page_size());
  void* addr = mmap(nullptr, aligned, kExecProt, kExecFlags, -1, 0);
  if (addr == MAP_FAILED) {
    return {};
  }
  return {addr, aligned};
}

exec_block allocate_near(void* target, size_t size, size_t range) {
  if (!target || size == 0 || range == 0) {
    return {};
  }

  const size_t page = page_size();
  const size_t aligned = align_up(size, page);

  const auto origin = reinterpret_cast<uintptr_t>(target);
  const uintptr_t lowest = align_up(origin > range ? origin - range : page, page);
  uintptr_t highest = origin + range;
  if (highest < origin) {
    highest = UINTPTR_MAX;
  }
  if (highest < lowest + aligned) {
    return {};
  }
  const uintptr_t highest_start = align_down(highest - aligned, page);

  constexpr size_t kMaxAttempts = 4096;
  size_t step = align_up(range / kMaxAttempts, page);
  if (step < page) {
    step = page;
  }

  for (size_t offset = step; offset <= range; offset += step) {
    const uintptr_t low = origin >= offset ? align_down(origin - offset, page) : 0;
    if (low >= lowest && low <= highest_start) {
      if (void* addr = map_at(low, aligned, lowest, highest_start)) {
        return {addr, aligned};
      }
    }
    const uintptr_t high = align_down(origin + offset, page);
    if (high >= lowest && high <= highest_start) {
      if (void* addr = map_at(high, aligned, lowest, highest_start)) {
        return {addr, aligned};
      }
    }
  }

  return {};
}

void free_executable(exec_block block) {
  if (!block.address || block.size == 0) {
    return;
  }
  munmap(block.address, block.size);
}

} // namespace l1::h00k::memory
