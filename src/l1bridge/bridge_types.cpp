#include "l1bridge/bridge_types.hpp"

namespace l1::bridge {

const char* to_string(bridge_error error) {
  switch (error) {
  case bridge_error::ok:
    return "ok";
  case bridge_error::capability_unavailable:
    return "capability_unavailable";
  case bridge_error::invalid_record_count:
    return "invalid_record_count";
  case bridge_error::hook_failed:
    return "hook_failed";
  }
  return "unknown";
}

const char* to_string(capability which) {
  switch (which) {
  case capability::enumerate:
    return "enumerate";
  case capability::load_events:
    return "load_events";
  }
  return "unknown";
}

} // namespace l1::bridge
