#pragma once
/** @file  Command.hpp
 *  @brief Modbus RTU request with toWire.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <vector>

// ANOD headers
#include "protocols/ModbusRtu.hpp"

namespace anod {
  namespace protocols {

    /**
 * @struct Command
 * @brief One register request addressed to a single slave.
 *
 *  * Reads carry a register count, writes carry the values.
 *  * Build with the named constructors; they reject counts the protocol can't frame.
 */
    struct Command {
      std::uint8_t slave{ 1 };
      FunctionCode function{ FunctionCode::ReadHoldingRegisters };
      std::uint16_t address{ 0 };
      std::uint16_t count{ 0 };
      std::vector<std::uint16_t> values{};

      static Command readHolding(std::uint8_t slave, std::uint16_t address, std::uint16_t count);
      /// Single value → function 0x06, several → 0x10.
      static Command write(std::uint8_t slave, std::uint16_t address,
                           const std::vector<std::uint16_t>& values);

      std::vector<std::uint8_t> toWire() const; ///< frame including CRC
    };

  } // namespace protocols
} // namespace anod
