/* @file ErrorMonitor.cpp
 * @brief de-duplicating failure fan-in
 *
 * © 2025 Dahu — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Dahu headers
#include "core/ErrorMonitor.hpp"

using namespace dahu::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++count_;
    if (!rememberIfNew(message))
      return;
    cb = escalation_;
  }
  // call outside the lock, the callback may report again
  if (cb)
    cb(message);
}

std::size_t ErrorMonitor::failureCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return count_;
}

std::vector<std::string> ErrorMonitor::seen() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_;
}

bool ErrorMonitor::rememberIfNew(const std::string& message) {
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}
