/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault fan-in; escalation runs outside the lock.
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace anod {
  namespace core {

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    void ErrorMonitor::clear() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::vector<std::string> ErrorMonitor::failures() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_;
    }

    std::uint64_t ErrorMonitor::reported() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return reported_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      Escalation cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++reported_;
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // callback may call back into us (e.g. clear()), so no lock held here
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace anod
