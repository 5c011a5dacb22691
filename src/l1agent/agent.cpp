#include "l1agent/agent.hpp"

#include <utility>

#include "l1base/cli/verbosity.hpp"

namespace l1::agent {

agent::agent(agent_config config) : config_(std::move(config)) {}

void agent::start() {
  cli::apply_verbosity(config_.verbose);
  log_.inf("l1brarian agent starting", redlog::field("verbosity", cli::verbosity_name(config_.verbose)));

  auto status = bridge_.setup(config_.bridge);
  if (!status.ok()) {
    log_.wrn(
        "bridge partially available", redlog::field("error", bridge::to_string(status.code)),
        redlog::field("detail", status.detail ? status.detail : "")
    );
  }
  for (const auto& diag : bridge_.diagnostics()) {
    log_.vrb("bridge diagnostic", redlog::field("capability", bridge::to_string(diag.which)),
             redlog::field("message", diag.message));
  }

  if (bridge_.available(bridge::capability::load_events)) {
    bridge_.observer().set([this](const bridge::library_load_event& event) { on_load(event); });
  }

  if (config_.dump_on_start) {
    dump_libraries("startup");
  }
}

void agent::stop() {
  bridge_.observer().clear();
  bridge_.shutdown();
  log_.vrb("l1brarian agent stopped");
}

void agent::dump_libraries(const char* reason) {
  if (!bridge_.available(bridge::capability::enumerate)) {
    return;
  }

  auto result = bridge_.get_mapped_libs();
  if (!result.ok()) {
    log_.err(
        "failed to enumerate libraries", redlog::field("reason", reason),
        redlog::field("error", bridge::to_string(result.status.code))
    );
    return;
  }

  log_.inf("mapped libraries", redlog::field("reason", reason), redlog::field("count", result.libraries.size()));
  for (const auto& library : result.libraries) {
    log_.inf(
        "library", redlog::field("base", "0x%016lx", library.base_address),
        redlog::field("name", library.name.empty() ? "<unnamed>" : library.name)
    );
  }
}

void agent::on_load(const bridge::library_load_event& event) {
  log_.inf(
      "library loaded", redlog::field("base", "0x%016lx", event.base_address),
      redlog::field("name", event.name.empty() ? "<unnamed>" : event.name)
  );
  if (config_.dump_on_load) {
    dump_libraries("load");
  }
}

} // namespace l1::agent
