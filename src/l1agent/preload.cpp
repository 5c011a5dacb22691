#include <exception>
#include <memory>

#include <redlog.hpp>

#include "l1agent/agent.hpp"

namespace {

std::unique_ptr<l1::agent::agent> g_agent;

} // namespace

__attribute__((constructor)) static void l1brarian_init() {
  auto log = redlog::get_logger("l1agent");
  try {
    g_agent = std::make_unique<l1::agent::agent>(l1::agent::agent_config::from_environment());
    g_agent->start();
  } catch (const std::exception& e) {
    log.err("exception during agent startup", redlog::field("what", e.what()));
    g_agent.reset();
  }
}

__attribute__((destructor)) static void l1brarian_fini() {
  if (!g_agent) {
    return;
  }
  auto log = redlog::get_logger("l1agent");
  try {
    g_agent->stop();
  } catch (const std::exception& e) {
    log.err("exception during agent shutdown", redlog::field("what", e.what()));
  }
  g_agent.reset();
}
