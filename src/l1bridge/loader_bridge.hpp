#pragma once

#include <optional>
#include <vector>

#include <redlog.hpp>

#include "l1bridge/bridge_types.hpp"
#include "l1bridge/observer_slot.hpp"
#include "l1bridge/record_decoder.hpp"
#include "l1h00k/hook.hpp"

namespace l1::bridge {

// queries the host's loader for its mapped libraries and forwards its load announcements.
// entry points are discovered once in setup(); a missing entry point disables only the
// capability that depends on it.
class loader_bridge {
public:
  loader_bridge();
  ~loader_bridge();

  loader_bridge(const loader_bridge&) = delete;
  loader_bridge& operator=(const loader_bridge&) = delete;

  bridge_status setup(const bridge_config& config = {});
  void shutdown();
  bool initialized() const { return initialized_; }

  // fresh snapshot from the host on every call
  mapped_libs_result get_mapped_libs() const;

  observer_slot& observer() { return observer_; }

  bool available(capability which) const;
  const std::vector<diagnostic>& diagnostics() const { return diagnostics_; }
  const std::optional<entry_point>& entry(capability which) const;
  const bridge_config& config() const { return config_; }

private:
  static void on_library_loaded(h00k::hook_info* info);

  void add_diagnostic(capability which, std::string message);
  bridge_status install_load_hook();

  mutable redlog::logger log_ = redlog::get_logger("l1bridge.bridge");
  bridge_config config_{};
  decode_limits limits_{};
  bool initialized_ = false;

  std::optional<entry_point> iter_entry_{};
  std::optional<entry_point> loaded_entry_{};
  h00k::hook_handle load_hook_{};
  bool load_events_ready_ = false;

  std::vector<diagnostic> diagnostics_;
  observer_slot observer_;
};

} // namespace l1::bridge
