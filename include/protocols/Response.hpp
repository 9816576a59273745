#pragma once
/** @file  Response.hpp
 *  @brief Modbus RTU reply with fromWire.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace anod {
  namespace protocols {

    struct Command;

    struct Response {
      std::uint8_t slave{ 0 };
      std::uint8_t function{ 0 };           ///< raw, exception bit included
      std::vector<std::uint16_t> registers; ///< read payload
      std::uint16_t address{ 0 };           ///< write echo
      std::uint16_t value{ 0 };             ///< write echo: value (0x06) or count (0x10)
      std::optional<std::uint8_t> exceptionCode;

      /// Parses a complete frame (CRC already checked); std::nullopt if the layout is wrong.
      static std::optional<Response> fromWire(std::span<const std::uint8_t> frame);

      /// True when this reply answers \p cmd (same slave, function, echo or register count).
      bool answers(const Command& cmd) const;
    };

  } // namespace protocols
} // namespace anod
