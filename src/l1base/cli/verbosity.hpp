#pragma once

#include <array>

#include <redlog.hpp>

namespace l1::cli {

// -v count ladder shared by the agent (L1BRARIAN_VERBOSE) and the demo host (-v flags)
inline constexpr std::array<redlog::level, 5> kVerbosityLadder = {
    redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug, redlog::level::pedantic
};

inline redlog::level level_from_verbosity(int count) {
  if (count <= 0) {
    return kVerbosityLadder.front();
  }
  if (count >= static_cast<int>(kVerbosityLadder.size())) {
    return kVerbosityLadder.back();
  }
  return kVerbosityLadder[static_cast<size_t>(count)];
}

inline const char* verbosity_name(int count) {
  static constexpr const char* names[] = {"info", "verbose", "trace", "debug", "pedantic"};
  if (count <= 0) {
    return names[0];
  }
  return count >= 4 ? names[4] : names[count];
}

inline void apply_verbosity(int count) { redlog::set_level(level_from_verbosity(count)); }

} // namespace l1::cli
