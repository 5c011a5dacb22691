#pragma once

#include <cstdint>
#include <string_view>

namespace l1::arch {

enum class family : uint16_t { unknown, x86, arm };

enum class mode : uint16_t { unknown, x86_32, x86_64, arm, aarch64 };

enum class byte_order : uint8_t { unknown, little, big };

struct arch_spec {
  family arch_family = family::unknown;
  mode arch_mode = mode::unknown;
  byte_order arch_byte_order = byte_order::unknown;
  uint32_t pointer_bits = 0;
};

inline constexpr bool operator==(const arch_spec& lhs, const arch_spec& rhs) noexcept {
  return lhs.arch_family == rhs.arch_family && lhs.arch_mode == rhs.arch_mode &&
         lhs.arch_byte_order == rhs.arch_byte_order && lhs.pointer_bits == rhs.pointer_bits;
}

inline constexpr bool operator!=(const arch_spec& lhs, const arch_spec& rhs) noexcept { return !(lhs == rhs); }

// family, pointer width and byte order implied by a mode
arch_spec spec_for(mode mode_value);
arch_spec detect_host_arch_spec();
std::string_view mode_name(mode mode_value);

} // namespace l1::arch
