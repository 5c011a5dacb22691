#pragma once

#include <cstddef>
#include <cstdint>

namespace l1::h00k {

// writes into mapped code, restoring the region's original protection afterwards
class code_patcher {
public:
  bool write(void* address, const uint8_t* bytes, size_t size);
  bool restore(void* address, const uint8_t* bytes, size_t size);

  int last_os_error() const { return last_errno_; }

private:
  int last_errno_ = 0;
};

} // namespace l1::h00k
