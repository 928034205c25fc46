#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central failure aggregator & escalation helper.
 *
 *  © 2025 Dahu — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace dahu::core {

  /**
 * @class ErrorMonitor
 * @brief Components call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique message.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so the presentation layer doesn’t get spammed.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that surfaces a failure to the user.
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by components on failure; forwards new messages to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Number of notifications received, duplicates included.
    std::size_t failureCount() const;

    /// Unique messages seen so far, in arrival order.
    std::vector<std::string> seen() const;

  private:
    bool rememberIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::size_t count_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace dahu::core
