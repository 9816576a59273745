/* @file Command.cpp
 * @brief request framing for read / write holding registers
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// ANOD headers
#include "protocols/Command.hpp"

using namespace anod::protocols;

namespace {
  void putWord(std::vector<std::uint8_t>& out, std::uint16_t word) {
    out.push_back(static_cast<std::uint8_t>(word >> 8));
    out.push_back(static_cast<std::uint8_t>(word & 0xFF));
  }
} // namespace

Command Command::readHolding(std::uint8_t slave, std::uint16_t address, std::uint16_t count) {
  if (count == 0 || count > kMaxReadCount)
    throw std::invalid_argument("[Command] read count out of range: " + std::to_string(count));
  return Command{ slave, FunctionCode::ReadHoldingRegisters, address, count, {} };
}

Command Command::write(std::uint8_t slave, std::uint16_t address,
                       const std::vector<std::uint16_t>& values) {
  if (values.empty() || values.size() > kMaxWriteCount)
    throw std::invalid_argument("[Command] write count out of range: " +
                                std::to_string(values.size()));
  const auto fn = values.size() == 1 ? FunctionCode::WriteSingleRegister
                                     : FunctionCode::WriteMultipleRegisters;
  return Command{ slave, fn, address, static_cast<std::uint16_t>(values.size()), values };
}

std::vector<std::uint8_t> Command::toWire() const {
  std::vector<std::uint8_t> out;
  out.reserve(9 + values.size() * 2);
  out.push_back(slave);
  out.push_back(static_cast<std::uint8_t>(function));
  putWord(out, address);

  switch (function) {
  case FunctionCode::ReadHoldingRegisters:
    putWord(out, count);
    break;
  case FunctionCode::WriteSingleRegister:
    putWord(out, values.at(0));
    break;
  case FunctionCode::WriteMultipleRegisters:
    putWord(out, static_cast<std::uint16_t>(values.size()));
    out.push_back(static_cast<std::uint8_t>(values.size() * 2));
    for (auto v : values)
      putWord(out, v);
    break;
  }

  const std::uint16_t crc = crc16(out);
  out.push_back(static_cast<std::uint8_t>(crc & 0xFF)); // RTU sends the CRC low byte first
  out.push_back(static_cast<std::uint8_t>(crc >> 8));
  return out;
}
