#pragma once
/** @file  RegisterClient.hpp
 *  @brief Serialised Modbus RTU register client with bounded retry.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

// ANOD headers
#include "core/Errors.hpp"
#include "io/SerialChannel.hpp" // RegisterClient owns the SerialChannel and requires full type knowledge
#include "protocols/Command.hpp"
#include "protocols/Response.hpp"

namespace anod {
  namespace core {

    class Logger;

    struct ClientOptions {
      std::uint8_t slaveAddress{ 1 };
      std::chrono::milliseconds timeout{ 1000 }; ///< per attempt, request sent → reply complete
      int maxAttempts{ 3 };
    };

    /**
 * @class RegisterClient
 * @brief Read / write holding registers over a half-duplex serial link.
 *
 *  * One exchange in flight at a time; concurrent callers queue on a mutex.
 *  * Timeouts, CRC errors and garbled frames are retried with the same payload up to
 *    `maxAttempts`, then surface as CommunicationError carrying the last cause.
 *  * Device exception replies are not retried.
 *  * Knows nothing about what the registers mean.
 */
    class RegisterClient {
    public:
      RegisterClient(std::unique_ptr<io::SerialChannel> channel, ClientOptions options,
                     std::shared_ptr<Logger> logger = nullptr);
      ~RegisterClient() = default;

      //---public APIs------------------------------------------------------
      std::vector<std::uint16_t> readRegisters(std::uint16_t address, std::uint16_t count);
      void writeRegisters(std::uint16_t address, const std::vector<std::uint16_t>& values);

      const ClientOptions& options() const { return options_; }

      /// Upper bound on how long one call can block (every attempt timing out).
      std::chrono::milliseconds worstCaseLatency() const {
        return options_.timeout * options_.maxAttempts;
      }

      RegisterClient(const RegisterClient&) = delete;
      RegisterClient& operator=(const RegisterClient&) = delete;

    private:
      protocols::Response exchange(const protocols::Command& cmd);

      std::unique_ptr<io::SerialChannel> channel_;
      ClientOptions options_;
      std::shared_ptr<Logger> logger_;
      std::mutex exchangeMtx_; ///< serialises whole request/response exchanges
    };

  } // namespace core
} // namespace anod
