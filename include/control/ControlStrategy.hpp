#pragma once
/** @file  ControlStrategy.hpp
 *  @brief Abstract base class for all setpoint-tracking control laws.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace anod::control {

  enum class ControlMode : std::uint8_t { Linear, Pid, Feedforward };

  const char* toString(ControlMode mode);

  /// Accepts "linear", "pid", "feedforward" (case-insensitive).
  std::optional<ControlMode> modeFromString(const std::string& name);

  /**
 * @struct StrategyParameters
 * @brief Mode and gains chosen at experiment start; immutable for the run.
 *
 *  Also copied into every Sample so a row is self-describing.
 */
  struct StrategyParameters {
    ControlMode mode{ ControlMode::Linear };
    double kp{ 0.0 };
    double ki{ 0.0 };
    double kd{ 0.0 };
    double kff{ 1.0 };
    std::optional<double> integralLimit{}; ///< |integral| clamp, none = unbounded
    double outputMin{ -std::numeric_limits<double>::infinity() };
    double outputMax{ std::numeric_limits<double>::infinity() };
  };

  /// Throws core::ValidationError on non-finite gains, negative limit or empty output range.
  void validate(const StrategyParameters& params);

  /**
 * @class ControlStrategy
 * @brief Common polymorphic interface for the control laws (Linear, PID,
 *        Feedforward + feedback).
 *
 *  * Runs synchronously on the controller thread; never touched concurrently.
 *  * Owns no hardware.
 */
  class ControlStrategy {
  public:
    virtual ~ControlStrategy() = default;

    /**
     * @brief Next control signal.
     *
     * @param target   Instantaneous setpoint.
     * @param measured Latest measurement of the controlled quantity.
     * @param dt       Seconds since the previous call (>= 0).
     */
    virtual double compute(double target, double measured, double dt) = 0;

    /// Back to the freshly constructed state.
    virtual void reset() = 0;
  };

} // namespace anod::control
