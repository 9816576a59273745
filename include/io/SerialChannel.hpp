#pragma once
/** @file  SerialChannel.hpp
 *  @brief Non-blocking UART byte I/O wrapper (uses poll/termios under the hood).
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Linux header
#include <termios.h> // for speed_t types e.g., B9600

namespace anod {
  namespace io {

    /**
 * @class SerialChannel
 * @brief RAII wrapper around a single /dev/tty* file descriptor.
 *
 *  * Raw 8N1 byte stream, no line discipline (binary register frames).
 *  * Reads are bounded by a caller supplied timeout.
 *  * *Non-copyable*, but move-constructible.
 */

    class SerialChannel {

    public:
      //---ctr / dtr--------------------------------------------
      SerialChannel() = default;
      virtual ~SerialChannel(); // close the /dev/tty fd at destruction

      //---public API-------------------------------------------
      virtual bool open(const std::string& dev, speed_t baud);
      virtual bool write(std::span<const std::uint8_t> bytes); // returns false on EIO

      /// Reads exactly \p count bytes; std::nullopt on timeout, disconnect or error.
      virtual std::optional<std::vector<std::uint8_t>> read(std::size_t count,
                                                            std::chrono::milliseconds timeout);

      /// Drops everything received so far (late replies from an earlier exchange).
      virtual void discardInput();

      virtual bool isOpen() const { return fd_ >= 0; }
      void close();

      /// Maps a numeric baud rate (9600, 115200, ...) to its termios constant.
      static std::optional<speed_t> baudFromInt(int baud);

      //---non-copyable-----------------------------------------
      SerialChannel(const SerialChannel&) = delete;
      SerialChannel& operator=(const SerialChannel&) = delete;

      //---mv and mv assign-------------------------------------
      SerialChannel(SerialChannel&& other) noexcept;
      SerialChannel& operator=(SerialChannel&& other) noexcept;

    private:
      int fd_{ -1 };                          ///< POSIX fd (-1==closed)
      std::vector<std::uint8_t> rx_buffer_{}; ///< bytes received but not yet consumed
    };
  } // namespace io
} // namespace anod
