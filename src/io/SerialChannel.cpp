/* @file SerialChannel.cpp
 * @brief IO abstraction layer that wraps ttyUSBx - handles file descriptor, raw byte io and RAII - POSIX compliant
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// Linux headers
#include <errno.h> // Error integer and strerror() function
#include <fcntl.h> // Contains file controls like O_RDWR
#include <poll.h>
#include <unistd.h> // write(), read(), close()

// ANOD headers
#include "io/SerialChannel.hpp"

using namespace anod::io;

SerialChannel::~SerialChannel() { close(); }

SerialChannel::SerialChannel(SerialChannel&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), rx_buffer_(std::move(other.rx_buffer_)) {}

SerialChannel& SerialChannel::operator=(SerialChannel&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    rx_buffer_ = std::move(other.rx_buffer_);
  }
  return *this;
}

bool SerialChannel::open(const std::string& dev, speed_t baud) {
  close();

  // open non-blocking, dont become ctrl-TTY
  fd_ = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    std::cerr << "Error " << errno << " from open: " << strerror(errno) << "\n";
    return false;
  }

  // fetch current attrs
  struct termios tty;
  if (tcgetattr(fd_, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcgetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }

  // raw 8N1, no flow control
  cfmakeraw(&tty);
  tty.c_cflag &= ~(CSIZE | PARENB | CSTOPB);
  tty.c_cflag |= CS8 | CLOCAL | CREAD;
  tty.c_cflag &= ~CRTSCTS;
  tty.c_iflag &= ~(IXON | IXOFF | IXANY);

  cfsetispeed(&tty, baud);
  cfsetospeed(&tty, baud);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    std::cerr << "Error " << errno << " from tcsetattr: " << strerror(errno) << "\n";
    close();
    return false;
  }
  rx_buffer_.clear();
  return true;
}

bool SerialChannel::write(std::span<const std::uint8_t> bytes) {

  if (fd_ < 0) {
    return false;
  }

  // POSIX write loop: a frame is either written completely or reported as failed
  std::size_t total = 0;
  while (total < bytes.size()) {
    ssize_t written = ::write(fd_, bytes.data() + total, bytes.size() - total);
    if (written > 0) {
      total += static_cast<std::size_t>(written);
    } else if (written == -1 && errno == EINTR) {
      continue; // try again
    } else if (written == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{ fd_, POLLOUT, 0 };
      if (::poll(&pfd, 1, 100) == -1 && errno != EINTR) {
        std::cerr << "poll: " << strerror(errno) << '\n';
        return false;
      }
    } else {
      std::cerr << "Error: " << errno << " from write: " << strerror(errno) << "\n";
      return false;
    }
  }

  // half-duplex links need the frame on the wire before the reply can start
  if (tcdrain(fd_) != 0) {
    std::cerr << "Error: " << errno << " from tcdrain: " << strerror(errno) << "\n";
    return false;
  }
  return true;
}

// -------------------------------------------------------------------
// SerialChannel::read
// Non-blocking exact-length reader with timeout and internal buffer.
// Returns std::nullopt on timeout, disconnect, or error; bytes received
// before a timeout stay buffered until discardInput().
// -------------------------------------------------------------------
std::optional<std::vector<std::uint8_t>> SerialChannel::read(std::size_t count,
                                                             std::chrono::milliseconds timeout) {
  if (fd_ < 0)
    return std::nullopt;

  std::uint8_t temp[256];
  pollfd pfd{ fd_, POLLIN, 0 };

  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (rx_buffer_.size() < count) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return std::nullopt; // timeout/partial

    auto ms_left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    int ms = std::max(1, static_cast<int>(ms_left.count()));

    int rc = ::poll(&pfd, 1, ms);
    if (rc == -1) {
      if (errno == EINTR)
        continue; // interrupted → retry
      std::cerr << "poll: " << strerror(errno) << '\n';
      return std::nullopt;
    }
    if (rc == 0)
      continue; // loop re-checks the deadline

    if (pfd.revents & (POLLERR | POLLHUP)) {
      close();
      return std::nullopt;
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = ::read(fd_, temp, sizeof(temp));
      if (n > 0) {
        rx_buffer_.insert(rx_buffer_.end(), temp, temp + n);
      } else if (n == 0) { // EOF / disconnect
        close();
        return std::nullopt;
      } else if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue; // transient → retry
      } else {
        std::cerr << "read: " << strerror(errno) << '\n';
        return std::nullopt;
      }
    }
  }

  std::vector<std::uint8_t> out(rx_buffer_.begin(),
                                rx_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
  rx_buffer_.erase(rx_buffer_.begin(), rx_buffer_.begin() + static_cast<std::ptrdiff_t>(count));
  return out;
}

void SerialChannel::discardInput() {
  rx_buffer_.clear();
  if (fd_ >= 0)
    tcflush(fd_, TCIFLUSH);
}

void SerialChannel::close() {
  if (fd_ >= 0)
    ::close(fd_);
  fd_ = -1;
  rx_buffer_.clear();
}

std::optional<speed_t> SerialChannel::baudFromInt(int baud) {
  switch (baud) {
  case 1200:
    return B1200;
  case 2400:
    return B2400;
  case 4800:
    return B4800;
  case 9600:
    return B9600;
  case 19200:
    return B19200;
  case 38400:
    return B38400;
  case 57600:
    return B57600;
  case 115200:
    return B115200;
  default:
    return std::nullopt;
  }
}
