/* @file ModbusRtu.cpp
 * @brief CRC and length rules shared by Command and Response
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include "protocols/ModbusRtu.hpp"

namespace anod {
  namespace protocols {

    std::uint16_t crc16(std::span<const std::uint8_t> bytes) {
      std::uint16_t crc = 0xFFFF;
      for (std::uint8_t b : bytes) {
        crc ^= b;
        for (int bit = 0; bit < 8; ++bit) {
          if (crc & 0x0001)
            crc = static_cast<std::uint16_t>((crc >> 1) ^ 0xA001);
          else
            crc = static_cast<std::uint16_t>(crc >> 1);
        }
      }
      return crc;
    }

    bool hasValidCrc(std::span<const std::uint8_t> frame) {
      if (frame.size() < kCrcLength + 2)
        return false;
      const auto body = frame.first(frame.size() - kCrcLength);
      const std::uint16_t expected = crc16(body);
      const std::uint16_t received = static_cast<std::uint16_t>(
          frame[frame.size() - 2] | (frame[frame.size() - 1] << 8));
      return expected == received;
    }

    std::optional<std::size_t> expectedFrameLength(std::span<const std::uint8_t> header) {
      if (header.size() < kHeaderLength)
        return std::nullopt;

      const std::uint8_t function = header[1];
      if (function & kExceptionBit)
        return 3 + kCrcLength; // slave, function, exception code

      switch (static_cast<FunctionCode>(function)) {
      case FunctionCode::ReadHoldingRegisters:
        return kHeaderLength + header[2] + kCrcLength; // header[2] == byte count
      case FunctionCode::WriteSingleRegister:
      case FunctionCode::WriteMultipleRegisters:
        return 6 + kCrcLength; // slave, function, address, value|count
      default:
        return std::nullopt;
      }
    }

  } // namespace protocols
} // namespace anod
