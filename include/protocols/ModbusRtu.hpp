#pragma once
/** @file  ModbusRtu.hpp
 *  @brief Modbus RTU framing constants, CRC-16 and frame length rules.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace anod {
  namespace protocols {

    enum class FunctionCode : std::uint8_t {
      ReadHoldingRegisters = 0x03,
      WriteSingleRegister = 0x06,
      WriteMultipleRegisters = 0x10,
    };

    inline constexpr std::uint8_t kExceptionBit = 0x80;
    inline constexpr std::size_t kHeaderLength = 3; ///< slave + function + first payload byte
    inline constexpr std::size_t kCrcLength = 2;
    inline constexpr std::uint16_t kMaxReadCount = 125;  ///< per Modbus application spec
    inline constexpr std::uint16_t kMaxWriteCount = 123; ///< per Modbus application spec

    /// CRC-16/MODBUS (poly 0xA001 reflected, init 0xFFFF).
    std::uint16_t crc16(std::span<const std::uint8_t> bytes);

    /// True when the trailing two bytes (low byte first) match the CRC of the rest.
    bool hasValidCrc(std::span<const std::uint8_t> frame);

    /**
     * @brief Total length of a response frame given its first kHeaderLength bytes.
     *
     * RTU has no delimiters, so the reader learns how much to wait for from the
     * function code (and the byte count for reads). std::nullopt for unknown functions.
     */
    std::optional<std::size_t> expectedFrameLength(std::span<const std::uint8_t> header);

  } // namespace protocols
} // namespace anod
