#pragma once

#include <redlog.hpp>

#include "l1agent/agent_config.hpp"
#include "l1bridge/loader_bridge.hpp"

namespace l1::agent {

// watches the host's loader from inside the host process
class agent {
public:
  explicit agent(agent_config config);

  void start();
  void stop();

  bridge::loader_bridge& loader() { return bridge_; }

private:
  void dump_libraries(const char* reason);
  void on_load(const bridge::library_load_event& event);

  agent_config config_;
  bridge::loader_bridge bridge_;
  redlog::logger log_ = redlog::get_logger("l1agent");
};

} // namespace l1::agent
