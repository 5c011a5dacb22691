#include "l1bridge/entry_points.hpp"

#include <cstdint>

#include <redlog.hpp>

#include "l1h00k/resolve/resolve.hpp"

namespace l1::bridge {

std::optional<entry_point> find_entry_point(const char* name, const char* module) {
  auto log = redlog::get_logger("l1bridge.entry");

  if (!name || name[0] == '\0') {
    return std::nullopt;
  }

  auto resolved = h00k::resolve::find_export(name, module);
  if (!resolved.error.ok() || !resolved.address) {
    log.dbg("export lookup failed", redlog::field("symbol", name),
            redlog::field("module", module && module[0] != '\0' ? module : "<main>"),
            redlog::field("reason", resolved.error.detail ? resolved.error.detail : "unknown"));
    return std::nullopt;
  }

  log.trc("export found", redlog::field("symbol", name),
          redlog::field("address", "0x%016lx", reinterpret_cast<uintptr_t>(resolved.address)),
          redlog::field("module", resolved.module.path));

  entry_point entry;
  entry.name = name;
  entry.address = resolved.address;
  entry.module_path = resolved.module.path;
  return entry;
}

} // namespace l1::bridge
