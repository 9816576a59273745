/* @file Response.cpp
 * @brief reply decoding and request/reply matching
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// ANOD headers
#include "protocols/Response.hpp"
#include "protocols/Command.hpp"
#include "protocols/ModbusRtu.hpp"

using namespace anod::protocols;

namespace {
  std::uint16_t word(std::span<const std::uint8_t> frame, std::size_t at) {
    return static_cast<std::uint16_t>((frame[at] << 8) | frame[at + 1]);
  }
} // namespace

std::optional<Response> Response::fromWire(std::span<const std::uint8_t> frame) {
  const auto length = expectedFrameLength(frame);
  if (!length || *length != frame.size())
    return std::nullopt;

  Response response;
  response.slave = frame[0];
  response.function = frame[1];

  if (response.function & kExceptionBit) {
    response.exceptionCode = frame[2];
    return response;
  }

  switch (static_cast<FunctionCode>(response.function)) {
  case FunctionCode::ReadHoldingRegisters: {
    const std::size_t byteCount = frame[2];
    if (byteCount % 2 != 0)
      return std::nullopt;
    response.registers.reserve(byteCount / 2);
    for (std::size_t i = 0; i < byteCount; i += 2)
      response.registers.push_back(word(frame, kHeaderLength + i));
    break;
  }
  case FunctionCode::WriteSingleRegister:
  case FunctionCode::WriteMultipleRegisters:
    response.address = word(frame, 2);
    response.value = word(frame, 4);
    break;
  default:
    return std::nullopt;
  }
  return response;
}

bool Response::answers(const Command& cmd) const {
  if (slave != cmd.slave)
    return false;
  if ((function & ~kExceptionBit) != static_cast<std::uint8_t>(cmd.function))
    return false;
  if (exceptionCode)
    return true;

  switch (cmd.function) {
  case FunctionCode::ReadHoldingRegisters:
    return registers.size() == cmd.count;
  case FunctionCode::WriteSingleRegister:
    return address == cmd.address && value == cmd.values.at(0);
  case FunctionCode::WriteMultipleRegisters:
    return address == cmd.address && value == cmd.count;
  }
  return false;
}
