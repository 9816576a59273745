/* @file PowerSupply.cpp
 * @brief scaling, range checks and 16/32-bit register packing for the PSU facade
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cmath>
#include <sstream>
#include <stdexcept>

// ANOD headers
#include "core/Errors.hpp"
#include "core/PowerSupply.hpp"
#include "core/RegisterClient.hpp"

using namespace anod::core;

PowerSupply::PowerSupply(std::shared_ptr<RegisterClient> client, RegisterMap map)
    : client_(std::move(client)), map_(std::move(map)) {
  if (!client_)
    throw std::invalid_argument("[PowerSupply] register client is nullptr");
}

double PowerSupply::get(Quantity q) {
  const auto& spec = map_.at(q);
  return static_cast<double>(readRaw(spec)) / spec.scale;
}

void PowerSupply::set(Quantity q, double value) {
  const auto& spec = map_.at(q);

  if (spec.access != Access::ReadWrite)
    throw ValidationError(std::string("[PowerSupply] ") + toString(q) + " is read-only");

  if (!std::isfinite(value) || value < spec.minValue || value > spec.maxValue) {
    std::ostringstream os;
    os << "[PowerSupply] " << toString(q) << " = " << value << " outside safe range ["
       << spec.minValue << ", " << spec.maxValue << "]";
    throw ValidationError(os.str());
  }

  const double maxRaw = spec.width == 2 ? 4294967295.0 : 65535.0;
  const double raw = std::floor(value * spec.scale + 0.5);
  if (raw < 0.0 || raw > maxRaw)
    throw ValidationError(std::string("[PowerSupply] ") + toString(q) +
                          " does not fit its register");

  writeRaw(spec, static_cast<std::uint32_t>(raw));
}

ProtectionFlags PowerSupply::readProtectionFlags() {
  const auto raw = readRaw(map_.at(Quantity::ProtectionState));
  return decodeProtectionFlags(static_cast<std::uint16_t>(raw));
}

void PowerSupply::setOutputEnabled(bool on) { set(Quantity::OutputEnable, on ? 1.0 : 0.0); }

bool PowerSupply::outputEnabled() { return readRaw(map_.at(Quantity::OutputEnable)) != 0; }

DeviceInfo PowerSupply::identify() {
  DeviceInfo info;
  info.model = static_cast<std::uint16_t>(readRaw(map_.at(Quantity::Model)));
  info.classCode = static_cast<std::uint16_t>(readRaw(map_.at(Quantity::ClassCode)));
  return info;
}

RegisterMap PowerSupply::probeScaling(RegisterClient& client, const RegisterMap& base) {
  const auto& spec = base.at(Quantity::DecimalPoints);
  const auto words = client.readRegisters(spec.address, 1);
  return base.withDecimalPoints(words.at(0));
}

std::uint32_t PowerSupply::readRaw(const RegisterSpec& spec) {
  const auto words = client_->readRegisters(spec.address, spec.width);
  if (spec.width == 2)
    return (static_cast<std::uint32_t>(words.at(0)) << 16) | words.at(1);
  return words.at(0);
}

void PowerSupply::writeRaw(const RegisterSpec& spec, std::uint32_t raw) {
  if (spec.width == 2) {
    client_->writeRegisters(spec.address, { static_cast<std::uint16_t>(raw >> 16),
                                            static_cast<std::uint16_t>(raw & 0xFFFF) });
  } else {
    client_->writeRegisters(spec.address, { static_cast<std::uint16_t>(raw) });
  }
}
