#pragma once
/** @file  PowerSupply.hpp
 *  @brief Typed get/set of physical quantities on top of RegisterClient.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <memory>

// ANOD headers
#include "core/Protection.hpp"
#include "core/RegisterMap.hpp"

namespace anod {
  namespace core {

    class RegisterClient;

    struct DeviceInfo {
      std::uint16_t model{ 0 };
      std::uint16_t classCode{ 0 };
    };

    /**
 * @class PowerSupply
 * @brief Device facade: resolves a Quantity through the RegisterMap, scales raw words
 *        to engineering units and back.
 *
 *  * Writes outside the quantity's safe range throw ValidationError before any I/O.
 *  * CommunicationError from the client passes through unchanged; the caller decides
 *    whether to retry, pause or abort.
 */
    class PowerSupply {
    public:
      PowerSupply(std::shared_ptr<RegisterClient> client, RegisterMap map);

      double get(Quantity q);
      void set(Quantity q, double value);

      ProtectionFlags readProtectionFlags();

      void setOutputEnabled(bool on);
      bool outputEnabled();

      DeviceInfo identify();

      const RegisterMap& registerMap() const { return map_; }

      /// Reads the decimal-point register and returns \p base rescaled accordingly.
      static RegisterMap probeScaling(RegisterClient& client, const RegisterMap& base);

    private:
      std::uint32_t readRaw(const RegisterSpec& spec);
      void writeRaw(const RegisterSpec& spec, std::uint32_t raw);

      std::shared_ptr<RegisterClient> client_;
      const RegisterMap map_;
    };

  } // namespace core
} // namespace anod
