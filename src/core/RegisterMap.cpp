/* @file RegisterMap.cpp
 * @brief default register layout and decimal-point scaling
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cmath>

// ANOD headers
#include "core/Errors.hpp"
#include "core/RegisterMap.hpp"

using namespace anod::core;

namespace anod {
  namespace core {
    const char* toString(Quantity q) {
      switch (q) {
      case Quantity::OutputEnable:
        return "OutputEnable";
      case Quantity::ProtectionState:
        return "ProtectionState";
      case Quantity::Model:
        return "Model";
      case Quantity::ClassCode:
        return "ClassCode";
      case Quantity::DecimalPoints:
        return "DecimalPoints";
      case Quantity::MeasuredVoltage:
        return "MeasuredVoltage";
      case Quantity::MeasuredCurrent:
        return "MeasuredCurrent";
      case Quantity::MeasuredPower:
        return "MeasuredPower";
      case Quantity::OverVoltageLimit:
        return "OverVoltageLimit";
      case Quantity::OverCurrentLimit:
        return "OverCurrentLimit";
      case Quantity::OverPowerLimit:
        return "OverPowerLimit";
      case Quantity::VoltageSetpoint:
        return "VoltageSetpoint";
      case Quantity::CurrentSetpoint:
        return "CurrentSetpoint";
      default:
        return "Unknown";
      }
    }
  } // namespace core
} // namespace anod

RegisterMap RegisterMap::defaults() {
  constexpr double kV = 100.0, kA = 1000.0, kW = 100.0;
  constexpr double kWord = 65535.0;

  RegisterMap map;
  auto set = [&map](Quantity q, RegisterSpec spec) { map.specs_[index(q)] = spec; };

  set(Quantity::OutputEnable, { 0x0001, 1, 1.0, Access::ReadWrite, 0.0, 1.0 });
  set(Quantity::ProtectionState, { 0x0002, 1, 1.0, Access::ReadOnly, 0.0, kWord });
  set(Quantity::Model, { 0x0003, 1, 1.0, Access::ReadOnly, 0.0, kWord });
  set(Quantity::ClassCode, { 0x0004, 1, 1.0, Access::ReadOnly, 0.0, kWord });
  set(Quantity::DecimalPoints, { 0x0005, 1, 1.0, Access::ReadOnly, 0.0, kWord });
  set(Quantity::MeasuredVoltage, { 0x0010, 1, kV, Access::ReadOnly, 0.0, kWord / kV });
  set(Quantity::MeasuredCurrent, { 0x0011, 1, kA, Access::ReadOnly, 0.0, kWord / kA });
  set(Quantity::MeasuredPower, { 0x0012, 2, kW, Access::ReadOnly, 0.0, 4294967295.0 / kW });
  set(Quantity::OverVoltageLimit, { 0x0020, 1, kV, Access::ReadWrite, 0.0, kWord / kV });
  set(Quantity::OverCurrentLimit, { 0x0021, 1, kA, Access::ReadWrite, 0.0, kWord / kA });
  set(Quantity::OverPowerLimit, { 0x0022, 2, kW, Access::ReadWrite, 0.0, 4294967295.0 / kW });
  set(Quantity::VoltageSetpoint, { 0x0030, 1, kV, Access::ReadWrite, 0.0, 100.0 });
  set(Quantity::CurrentSetpoint, { 0x0031, 1, kA, Access::ReadWrite, 0.0, 10.0 });
  return map;
}

RegisterMap RegisterMap::with(Quantity q, const RegisterSpec& spec) const {
  if (spec.width != 1 && spec.width != 2)
    throw ValidationError(std::string("[RegisterMap] width must be 1 or 2 for ") + toString(q));
  if (!(spec.scale > 0.0))
    throw ValidationError(std::string("[RegisterMap] scale must be > 0 for ") + toString(q));
  if (spec.minValue > spec.maxValue)
    throw ValidationError(std::string("[RegisterMap] empty range for ") + toString(q));

  RegisterMap copy = *this;
  copy.specs_[index(q)] = spec;
  return copy;
}

RegisterMap RegisterMap::withRange(Quantity q, double minValue, double maxValue) const {
  RegisterSpec spec = at(q);
  spec.minValue = minValue;
  spec.maxValue = maxValue;
  return with(q, spec);
}

RegisterMap RegisterMap::withDecimalPoints(std::uint16_t raw) const {
  const double wScale = std::pow(10.0, raw & 0x0F);
  const double aScale = std::pow(10.0, (raw >> 4) & 0x0F);
  const double vScale = std::pow(10.0, (raw >> 8) & 0x0F);

  RegisterMap copy = *this;
  for (auto q : { Quantity::MeasuredVoltage, Quantity::OverVoltageLimit, Quantity::VoltageSetpoint })
    copy.specs_[index(q)].scale = vScale;
  for (auto q : { Quantity::MeasuredCurrent, Quantity::OverCurrentLimit, Quantity::CurrentSetpoint })
    copy.specs_[index(q)].scale = aScale;
  for (auto q : { Quantity::MeasuredPower, Quantity::OverPowerLimit })
    copy.specs_[index(q)].scale = wScale;
  return copy;
}
