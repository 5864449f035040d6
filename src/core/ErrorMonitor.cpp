/* @file ErrorMonitor.cpp
 * @brief De-duplicating fault sink with a single escalation callback.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// cycleflow headers
#include "core/ErrorMonitor.hpp"

using namespace cycleflow::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard lock(mtx_);
  return seen_.size();
}

void ErrorMonitor::forwardIfNew(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard lock(mtx_);
    if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
      return;
    seen_.push_back(message);
    cb = escalation_;
  }
  // call outside the lock, the callback may re-enter
  if (cb)
    cb(message);
}
