#pragma once
/** @file  Protection.hpp
 *  @brief Power-supply protection status bits and their decoded set.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <set>
#include <string>

namespace anod {
  namespace core {

    /// Bit values as reported by the protection state register.
    enum class ProtectionFlag : std::uint16_t {
      OverVoltage = 0x01,
      OverCurrent = 0x02,
      OverPower = 0x04,
      OverTemperature = 0x08,
      ShortCircuit = 0x10,
    };

    using ProtectionFlags = std::set<ProtectionFlag>;

    inline const char* toString(ProtectionFlag f) {
      switch (f) {
      case ProtectionFlag::OverVoltage:
        return "OVP";
      case ProtectionFlag::OverCurrent:
        return "OCP";
      case ProtectionFlag::OverPower:
        return "OPP";
      case ProtectionFlag::OverTemperature:
        return "OTP";
      case ProtectionFlag::ShortCircuit:
        return "SCP";
      default:
        return "Unknown";
      }
    }

    /// Unknown bits are ignored.
    inline ProtectionFlags decodeProtectionFlags(std::uint16_t raw) {
      ProtectionFlags flags;
      for (auto f : { ProtectionFlag::OverVoltage, ProtectionFlag::OverCurrent,
                      ProtectionFlag::OverPower, ProtectionFlag::OverTemperature,
                      ProtectionFlag::ShortCircuit }) {
        if (raw & static_cast<std::uint16_t>(f))
          flags.insert(f);
      }
      return flags;
    }

    /// "OVP|OCP", or "none" for an empty set.
    inline std::string toString(const ProtectionFlags& flags) {
      if (flags.empty())
        return "none";
      std::string out;
      for (auto f : flags) {
        if (!out.empty())
          out += '|';
        out += toString(f);
      }
      return out;
    }

  } // namespace core
} // namespace anod
