#pragma once
/** @file  PidStrategy.hpp
 *  @brief Positional PID with optional integral clamp and output limits.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include "control/ControlStrategy.hpp"

namespace anod::control {

  /**
 * @class PidStrategy
 * @brief output = Kp·e + Ki·∫e dt + Kd·de/dt, clamped to [outputMin, outputMax].
 *
 *  * dt == 0 contributes nothing to the integral and a zero derivative term.
 *  * `integralLimit` clamps the accumulator itself (anti-windup).
 */
  class PidStrategy final : public ControlStrategy {
  public:
    explicit PidStrategy(const StrategyParameters& params);

    double compute(double target, double measured, double dt) override;
    void reset() override;

    double integral() const { return integral_; }
    double previousError() const { return previousError_; }

  private:
    StrategyParameters params_;
    double integral_{ 0.0 };
    double previousError_{ 0.0 };
  };

} // namespace anod::control
