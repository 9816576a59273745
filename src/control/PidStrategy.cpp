/* @file PidStrategy.cpp
 * @brief PID update with anti-windup clamp
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cmath>

// ANOD headers
#include "control/PidStrategy.hpp"
#include "core/Errors.hpp"

using namespace anod::control;

PidStrategy::PidStrategy(const StrategyParameters& params) : params_(params) { validate(params_); }

double PidStrategy::compute(double target, double measured, double dt) {
  if (!(dt >= 0.0) || !std::isfinite(dt))
    throw core::ValidationError("[PidStrategy] dt must be finite and >= 0");

  const double error = target - measured;

  integral_ += error * dt;
  if (params_.integralLimit)
    integral_ = std::clamp(integral_, -*params_.integralLimit, *params_.integralLimit);

  const double derivative = dt > 0.0 ? (error - previousError_) / dt : 0.0;
  previousError_ = error;

  const double output = params_.kp * error + params_.ki * integral_ + params_.kd * derivative;
  return std::clamp(output, params_.outputMin, params_.outputMax);
}

void PidStrategy::reset() {
  integral_ = 0.0;
  previousError_ = 0.0;
}
