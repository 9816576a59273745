#pragma once
/** @file  RegisterMap.hpp
 *  @brief Immutable quantity → register/scale/range table for the power supply.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace anod {
  namespace core {

    /**
 * @enum Quantity
 * @brief Strong-typed names for every register the facade exposes.
 */
    enum class Quantity : std::uint8_t {
      OutputEnable,
      ProtectionState,
      Model,
      ClassCode,
      DecimalPoints,
      MeasuredVoltage,
      MeasuredCurrent,
      MeasuredPower,
      OverVoltageLimit,
      OverCurrentLimit,
      OverPowerLimit,
      VoltageSetpoint,
      CurrentSetpoint,
      Count
    };
    static_assert(static_cast<std::uint8_t>(Quantity::Count) == 13,
                  "Quantity count changed please update RegisterMap::defaults()");

    const char* toString(Quantity q);

    enum class Access : std::uint8_t { ReadOnly, ReadWrite };

    struct RegisterSpec {
      std::uint16_t address{ 0 };
      std::uint8_t width{ 1 }; ///< 1 = 16 bit, 2 = 32 bit (high word first)
      double scale{ 1.0 };     ///< raw = physical * scale
      Access access{ Access::ReadOnly };
      double minValue{ 0.0 }; ///< safe range enforced on writes
      double maxValue{ std::numeric_limits<double>::max() };
    };

    /**
 * @class RegisterMap
 * @brief Value type built once at startup and passed into PowerSupply.
 *
 *  * No setters: the `with*` helpers return a modified copy, the original stays intact.
 *  * Tests build alternate maps the same way.
 */
    class RegisterMap {
    public:
      /// Register layout of the reference PSU (V ×100, A ×1000, W ×100).
      static RegisterMap defaults();

      const RegisterSpec& at(Quantity q) const { return specs_[index(q)]; }

      RegisterMap with(Quantity q, const RegisterSpec& spec) const;
      RegisterMap withRange(Quantity q, double minValue, double maxValue) const;

      /**
       * @brief Applies the device's decimal-point word.
       *
       * Nibbles: power bits 0-3, current bits 4-7, voltage bits 8-11; each gives the
       * number of decimals, i.e. scale 10^n for every register of that unit.
       */
      RegisterMap withDecimalPoints(std::uint16_t raw) const;

    private:
      RegisterMap() = default;
      static std::size_t index(Quantity q) { return static_cast<std::size_t>(q); }

      std::array<RegisterSpec, static_cast<std::size_t>(Quantity::Count)> specs_{};
    };

  } // namespace core
} // namespace anod
