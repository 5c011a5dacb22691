#pragma once

#include <cstddef>
#include <cstdint>

#include "l1host/library_record.hpp"

#define L1_HOST_EXPORT __attribute__((visibility("default")))

extern "C" {

typedef void (*l1_iter_callback)(const l1::host::library_record* records, size_t count);

// calls callback exactly once with the registered libraries; records live until it returns
L1_HOST_EXPORT void jni_loader_iter_libs(l1_iter_callback callback);

// announced after every library mapping; observers intercept this call
L1_HOST_EXPORT void jni_loader_lib_loaded(uint64_t base_address, const char* name);
}

namespace l1::host {

struct load_notification_stats {
  uint64_t calls = 0;
  uint64_t last_base = 0;
  const char* last_name = nullptr;
};

// what jni_loader_lib_loaded itself has recorded
load_notification_stats load_notifications();

} // namespace l1::host
