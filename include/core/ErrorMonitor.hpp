#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Fault fan-in for the experiment pipeline, escalates to SystemCoordinator.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace anod::core {

  /**
 * @class ErrorMonitor
 * @brief ExperimentController reports run-ending faults here (exhausted retries,
 *        protection trips, rejected setpoints); the escalation callback sees each
 *        distinct message once per run.
 *
 * * Thread-safe; the callback runs outside the lock and may call back in.
 * * `clear()` starts a new run: the same fault may escalate again.
 * * Virtual `notifyFailure()` so tests can substitute a gmock.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const std::string&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    void registerEscalation(Escalation cb);

    virtual void notifyFailure(const std::string& message);

    void clear();

    /// Distinct failures since the last clear(), oldest first.
    std::vector<std::string> failures() const;

    /// Every notifyFailure() since construction, duplicates included.
    std::uint64_t reported() const;

  private:
    void forwardIfNew(const std::string& message);

    Escalation escalation_{};
    std::vector<std::string> seen_;
    std::uint64_t reported_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace anod::core
