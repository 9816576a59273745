/* @file RegisterClient.cpp
 * @brief manages request/response register exchanges with the PSU over serial
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <sstream>
#include <stdexcept>
#include <string>

// ANOD headers
#include "core/Logger.hpp"
#include "core/RegisterClient.hpp"
#include "protocols/ModbusRtu.hpp"

using namespace anod::core;
using Cause = CommunicationError::Cause;

namespace {
  std::string describe(const anod::protocols::Command& cmd) {
    std::ostringstream os;
    os << "fn 0x" << std::hex << static_cast<int>(cmd.function) << " @0x" << cmd.address
       << std::dec << " x" << cmd.count;
    return os.str();
  }
} // namespace

RegisterClient::RegisterClient(std::unique_ptr<io::SerialChannel> channel, ClientOptions options,
                               std::shared_ptr<Logger> logger)
    : channel_(std::move(channel)), options_(options), logger_(std::move(logger)) {
  if (!channel_)
    throw std::invalid_argument("[RegisterClient] serial channel is nullptr");
  if (options_.maxAttempts < 1)
    throw ValidationError("[RegisterClient] maxAttempts must be >= 1");
  if (options_.timeout.count() <= 0)
    throw ValidationError("[RegisterClient] timeout must be > 0");
}

std::vector<std::uint16_t> RegisterClient::readRegisters(std::uint16_t address,
                                                         std::uint16_t count) {
  auto cmd = protocols::Command::readHolding(options_.slaveAddress, address, count);
  return exchange(cmd).registers;
}

void RegisterClient::writeRegisters(std::uint16_t address,
                                    const std::vector<std::uint16_t>& values) {
  auto cmd = protocols::Command::write(options_.slaveAddress, address, values);
  exchange(cmd);
}

anod::protocols::Response RegisterClient::exchange(const protocols::Command& cmd) {
  std::lock_guard<std::mutex> lock(exchangeMtx_);

  if (!channel_->isOpen())
    throw CommunicationError(Cause::ChannelFailure,
                             "[RegisterClient] serial channel not open (" + describe(cmd) + ")", 0);

  const auto wire = cmd.toWire();
  Cause lastCause = Cause::Timeout;

  for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
    if (attempt > 1 && logger_)
      logger_->log(LogLevel::Warning, "RegisterClient",
                   "retry " + std::to_string(attempt) + "/" +
                       std::to_string(options_.maxAttempts) + " after " + toString(lastCause) +
                       " (" + describe(cmd) + ")");

    // a late reply to the previous attempt must not be taken as this one's
    channel_->discardInput();

    if (!channel_->write(wire)) {
      lastCause = Cause::ChannelFailure;
      continue;
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    auto remaining = [&deadline] {
      return std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
    };

    auto frame = channel_->read(protocols::kHeaderLength, remaining());
    if (!frame) {
      lastCause = Cause::Timeout;
      continue;
    }

    const auto length = protocols::expectedFrameLength(*frame);
    if (!length) {
      lastCause = Cause::MalformedFrame;
      continue;
    }

    auto rest = channel_->read(*length - protocols::kHeaderLength, remaining());
    if (!rest) {
      lastCause = Cause::Timeout;
      continue;
    }
    frame->insert(frame->end(), rest->begin(), rest->end());

    if (!protocols::hasValidCrc(*frame)) {
      lastCause = Cause::ChecksumMismatch;
      continue;
    }

    auto response = protocols::Response::fromWire(*frame);
    if (!response || !response->answers(cmd)) {
      lastCause = Cause::MalformedFrame;
      continue;
    }

    if (response->exceptionCode)
      throw CommunicationError(Cause::DeviceException,
                               "[RegisterClient] device exception " +
                                   std::to_string(*response->exceptionCode) + " (" +
                                   describe(cmd) + ")",
                               attempt);

    return *response;
  }

  std::string errMsg = "[RegisterClient] " + describe(cmd) + " failed after " +
                       std::to_string(options_.maxAttempts) + " attempts: " + toString(lastCause);
  if (logger_)
    logger_->log(LogLevel::Error, "RegisterClient", errMsg);
  throw CommunicationError(lastCause, errMsg, options_.maxAttempts);
}
