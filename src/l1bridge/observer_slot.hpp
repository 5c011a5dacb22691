#pragma once

#include <functional>
#include <mutex>

#include "l1bridge/bridge_types.hpp"

namespace l1::bridge {

using load_observer = std::function<void(const library_load_event&)>;

// holds at most one observer; the last set wins
class observer_slot {
public:
  observer_slot() = default;
  observer_slot(const observer_slot&) = delete;
  observer_slot& operator=(const observer_slot&) = delete;

  void set(load_observer observer);
  void clear();
  bool has_observer() const;

  // runs the observer on the calling thread without holding the slot lock.
  // returns false when no observer is registered. exceptions from the observer propagate.
  bool notify(const library_load_event& event) const;

private:
  mutable std::mutex mutex_;
  load_observer observer_;
};

} // namespace l1::bridge
