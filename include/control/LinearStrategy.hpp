#pragma once
/** @file  LinearStrategy.hpp
 *  @brief Open-loop passthrough: the command is the setpoint.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include "control/ControlStrategy.hpp"

namespace anod::control {

  class LinearStrategy final : public ControlStrategy {
  public:
    double compute(double target, double, double) override { return target; }
    void reset() override {}
  };

} // namespace anod::control
