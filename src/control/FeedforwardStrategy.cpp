/* @file FeedforwardStrategy.cpp
 * @brief Kff·target + PID
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <limits>

// ANOD headers
#include "control/FeedforwardStrategy.hpp"

using namespace anod::control;

FeedforwardStrategy::FeedforwardStrategy(const StrategyParameters& params)
    : params_(params), feedback_(unclamped(params)) {}

StrategyParameters FeedforwardStrategy::unclamped(StrategyParameters params) {
  validate(params);
  params.outputMin = -std::numeric_limits<double>::infinity();
  params.outputMax = std::numeric_limits<double>::infinity();
  return params;
}

double FeedforwardStrategy::compute(double target, double measured, double dt) {
  const double output = params_.kff * target + feedback_.compute(target, measured, dt);
  return std::clamp(output, params_.outputMin, params_.outputMax);
}
