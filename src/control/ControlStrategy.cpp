/* @file ControlStrategy.cpp
 * @brief mode names and parameter validation
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cmath>

// ANOD headers
#include "control/ControlStrategy.hpp"
#include "core/Errors.hpp"

namespace anod::control {

  const char* toString(ControlMode mode) {
    switch (mode) {
    case ControlMode::Linear:
      return "linear";
    case ControlMode::Pid:
      return "pid";
    case ControlMode::Feedforward:
      return "feedforward";
    default:
      return "unknown";
    }
  }

  std::optional<ControlMode> modeFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto mode : { ControlMode::Linear, ControlMode::Pid, ControlMode::Feedforward }) {
      if (lower == toString(mode))
        return mode;
    }
    return std::nullopt;
  }

  void validate(const StrategyParameters& params) {
    for (double gain : { params.kp, params.ki, params.kd, params.kff }) {
      if (!std::isfinite(gain))
        throw core::ValidationError("[ControlStrategy] gains must be finite");
    }
    if (params.integralLimit && !(*params.integralLimit >= 0.0))
      throw core::ValidationError("[ControlStrategy] integral limit must be >= 0");
    if (std::isnan(params.outputMin) || std::isnan(params.outputMax) ||
        params.outputMin > params.outputMax)
      throw core::ValidationError("[ControlStrategy] output range is empty");
  }

} // namespace anod::control
