#include "l1bridge/observer_slot.hpp"

#include <utility>

namespace l1::bridge {

void observer_slot::set(load_observer observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

void observer_slot::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = nullptr;
}

bool observer_slot::has_observer() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<bool>(observer_);
}

bool observer_slot::notify(const library_load_event& event) const {
  load_observer observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = observer_;
  }
  if (!observer) {
    return false;
  }
  observer(event);
  return true;
}

} // namespace l1::bridge
