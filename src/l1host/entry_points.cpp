#include "l1host/entry_points.hpp"

#include <atomic>

#include "l1host/library_registry.hpp"

namespace {

std::atomic<uint64_t> g_loaded_calls{0};
std::atomic<uint64_t> g_last_loaded_base{0};
std::atomic<const char*> g_last_loaded_name{nullptr};

} // namespace

extern "C" {

L1_HOST_EXPORT void jni_loader_iter_libs(l1_iter_callback callback) {
  l1::host::library_registry::global().iterate(callback);
}

// kept out of line with a body long enough to carry an entry detour
L1_HOST_EXPORT __attribute__((noinline)) void jni_loader_lib_loaded(uint64_t base_address, const char* name) {
  g_last_loaded_base.store(base_address, std::memory_order_relaxed);
  g_last_loaded_name.store(name, std::memory_order_relaxed);
  g_loaded_calls.fetch_add(1, std::memory_order_acq_rel);
}
}

namespace l1::host {

load_notification_stats load_notifications() {
  load_notification_stats stats{};
  stats.calls = g_loaded_calls.load(std::memory_order_acquire);
  stats.last_base = g_last_loaded_base.load(std::memory_order_relaxed);
  stats.last_name = g_last_loaded_name.load(std::memory_order_relaxed);
  return stats;
}

} // namespace l1::host
