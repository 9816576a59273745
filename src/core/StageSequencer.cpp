/* @file StageSequencer.cpp
 * @brief stage editing and cursor advance with clamp-to-zero at boundaries
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>
#include <string>

// ANOD headers
#include "core/Errors.hpp"
#include "core/StageSequencer.hpp"

using namespace anod::core;

namespace {
  // accumulated float steps (10 × 0.1 s) must still close a 1 s stage
  bool reached(double elapsed, double duration) {
    return elapsed + 1e-9 * std::max(1.0, duration) >= duration;
  }
} // namespace

namespace anod {
  namespace core {
    const char* toString(StageSequencer::Phase phase) {
      switch (phase) {
      case StageSequencer::Phase::Idle:
        return "Idle";
      case StageSequencer::Phase::Running:
        return "Running";
      case StageSequencer::Phase::Complete:
        return "Complete";
      default:
        return "Unknown";
      }
    }
  } // namespace core
} // namespace anod

void StageSequencer::addStage(const Stage& stage) {
  check(stage);
  std::lock_guard<std::mutex> lock(mtx_);
  requireIdle("addStage");
  stages_.push_back(stage);
}

void StageSequencer::insertStage(std::size_t index, const Stage& stage) {
  check(stage);
  std::lock_guard<std::mutex> lock(mtx_);
  requireIdle("insertStage");
  if (index > stages_.size())
    throw std::out_of_range("[StageSequencer] insert index " + std::to_string(index));
  stages_.insert(stages_.begin() + static_cast<std::ptrdiff_t>(index), stage);
}

void StageSequencer::replaceStage(std::size_t index, const Stage& stage) {
  check(stage);
  std::lock_guard<std::mutex> lock(mtx_);
  requireIdle("replaceStage");
  stages_.at(index) = stage;
}

void StageSequencer::removeStage(std::size_t index) {
  std::lock_guard<std::mutex> lock(mtx_);
  requireIdle("removeStage");
  if (index >= stages_.size())
    throw std::out_of_range("[StageSequencer] remove index " + std::to_string(index));
  stages_.erase(stages_.begin() + static_cast<std::ptrdiff_t>(index));
}

void StageSequencer::reorder(std::size_t from, std::size_t to) {
  std::lock_guard<std::mutex> lock(mtx_);
  requireIdle("reorder");
  if (from >= stages_.size() || to >= stages_.size())
    throw std::out_of_range("[StageSequencer] reorder index out of range");
  if (from == to)
    return;

  const auto first = stages_.begin();
  if (from < to)
    std::rotate(first + static_cast<std::ptrdiff_t>(from),
                first + static_cast<std::ptrdiff_t>(from) + 1,
                first + static_cast<std::ptrdiff_t>(to) + 1);
  else
    std::rotate(first + static_cast<std::ptrdiff_t>(to), first + static_cast<std::ptrdiff_t>(from),
                first + static_cast<std::ptrdiff_t>(from) + 1);
}

void StageSequencer::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  requireIdle("clear");
  stages_.clear();
}

void StageSequencer::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (phase_ == Phase::Running)
    throw InvalidStateError("[StageSequencer] start while running");
  if (stages_.empty())
    throw EmptySequenceError();
  phase_ = Phase::Running;
  index_ = 0;
  elapsed_ = 0.0;
}

StageTick StageSequencer::advance(double dt) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (phase_ != Phase::Running)
    throw InvalidStateError(std::string("[StageSequencer] advance while ") + toString(phase_));
  if (!(dt >= 0.0) || !std::isfinite(dt))
    throw ValidationError("[StageSequencer] dt must be finite and >= 0");

  StageTick tick;
  elapsed_ += dt;

  const Stage& stage = stages_[index_];
  if (reached(elapsed_, stage.duration)) {
    if (index_ + 1 < stages_.size()) {
      ++index_;
      elapsed_ = 0.0; // overshoot discarded
      tick.stageChanged = true;
    } else {
      elapsed_ = stage.duration;
      phase_ = Phase::Complete;
      tick.complete = true;
    }
  }

  tick.target = targetLocked();
  tick.stageIndex = index_;
  tick.elapsed = elapsed_;
  return tick;
}

void StageSequencer::halt() {
  std::lock_guard<std::mutex> lock(mtx_);
  phase_ = Phase::Idle;
  index_ = 0;
  elapsed_ = 0.0;
}

double StageSequencer::currentTarget() const {
  std::lock_guard<std::mutex> lock(mtx_);
  if (stages_.empty())
    throw EmptySequenceError();
  return targetLocked();
}

StageSequencer::Phase StageSequencer::phase() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return phase_;
}

std::vector<Stage> StageSequencer::stages() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return stages_;
}

std::size_t StageSequencer::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return stages_.size();
}

double StageSequencer::totalDuration() const {
  std::lock_guard<std::mutex> lock(mtx_);
  double total = 0.0;
  for (const auto& s : stages_)
    total += s.duration;
  return total;
}

void StageSequencer::check(const Stage& stage) {
  if (!std::isfinite(stage.startValue) || !std::isfinite(stage.endValue))
    throw ValidationError("[StageSequencer] stage values must be finite");
  if (!(stage.duration > 0.0) || !std::isfinite(stage.duration))
    throw ValidationError("[StageSequencer] stage duration must be > 0");
}

void StageSequencer::requireIdle(const char* op) const {
  if (phase_ != Phase::Idle)
    throw InvalidStateError(std::string("[StageSequencer] ") + op + " not allowed while " +
                            toString(phase_));
}

double StageSequencer::targetLocked() const {
  const Stage& stage = stages_[index_];
  const double fraction = std::clamp(elapsed_ / stage.duration, 0.0, 1.0);
  return stage.startValue + (stage.endValue - stage.startValue) * fraction;
}
