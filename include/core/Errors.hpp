#pragma once
/** @file  Errors.hpp
 *  @brief Exception taxonomy shared by the device, sequencing and control layers.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>
#include <utility>

// ANOD headers
#include "core/Protection.hpp"

namespace anod {
  namespace core {

    /**
 * @class CommunicationError
 * @brief Register exchange failed after the client's retry budget (or at once for a
 *        device exception reply).
 */
    class CommunicationError : public std::runtime_error {
    public:
      enum class Cause { Timeout, ChecksumMismatch, MalformedFrame, DeviceException, ChannelFailure };

      CommunicationError(Cause cause, const std::string& what, int attempts)
          : std::runtime_error(what), cause_(cause), attempts_(attempts) {}

      Cause cause() const noexcept { return cause_; }
      int attempts() const noexcept { return attempts_; }

    private:
      Cause cause_;
      int attempts_;
    };

    inline const char* toString(CommunicationError::Cause c) {
      switch (c) {
      case CommunicationError::Cause::Timeout:
        return "timeout";
      case CommunicationError::Cause::ChecksumMismatch:
        return "checksum mismatch";
      case CommunicationError::Cause::MalformedFrame:
        return "malformed frame";
      case CommunicationError::Cause::DeviceException:
        return "device exception";
      case CommunicationError::Cause::ChannelFailure:
        return "channel failure";
      default:
        return "unknown";
      }
    }

    /// Out-of-range setpoint or malformed configuration; never retried.
    class ValidationError : public std::invalid_argument {
    public:
      using std::invalid_argument::invalid_argument;
    };

    class EmptySequenceError : public ValidationError {
    public:
      EmptySequenceError() : ValidationError("[StageSequencer] no stages configured") {}
    };

    /// Device reported a hardware protection trip.
    class ProtectionFaultError : public std::runtime_error {
    public:
      explicit ProtectionFaultError(ProtectionFlags flags)
          : std::runtime_error("[PowerSupply] protection tripped: " + toString(flags)),
            flags_(std::move(flags)) {}

      const ProtectionFlags& flags() const noexcept { return flags_; }

    private:
      ProtectionFlags flags_;
    };

    /// Operation not permitted in the current lifecycle state.
    class InvalidStateError : public std::logic_error {
    public:
      using std::logic_error::logic_error;
    };

  } // namespace core
} // namespace anod
