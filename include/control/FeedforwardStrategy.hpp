#pragma once
/** @file  FeedforwardStrategy.hpp
 *  @brief Open-loop term sized from the setpoint plus PID correction on the residual.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include "control/PidStrategy.hpp"

namespace anod::control {

  /// output = clamp(Kff·target + PID(target, measured, dt)); the inner PID is unclamped.
  class FeedforwardStrategy final : public ControlStrategy {
  public:
    explicit FeedforwardStrategy(const StrategyParameters& params);

    double compute(double target, double measured, double dt) override;
    void reset() override { feedback_.reset(); }

    const PidStrategy& feedback() const { return feedback_; }

  private:
    static StrategyParameters unclamped(StrategyParameters params);

    StrategyParameters params_;
    PidStrategy feedback_;
  };

} // namespace anod::control
