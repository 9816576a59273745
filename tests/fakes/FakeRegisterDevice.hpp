#pragma once
/** @file  FakeRegisterDevice.hpp
 *  @brief In-memory Modbus RTU slave behind the SerialChannel interface.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "io/SerialChannel.hpp"
#include "protocols/ModbusRtu.hpp"

namespace anod {
  namespace test {

    /**
 * @class FakeRegisterDevice
 * @brief Answers 0x03 / 0x06 / 0x10 requests from a register table.
 *
 *  * Ideal plant: a write to the voltage setpoint (0x0030) is mirrored into the
 *    measured voltage (0x0010); measured current follows a resistive load.
 *  * Fault injection: silent requests (timeouts), corrupted CRCs, exception replies,
 *    or going fully offline.
 *  * Thread-safe, so a test can inject faults while a controller thread is ticking.
 */
    class FakeRegisterDevice : public anod::io::SerialChannel {
    public:
      static constexpr std::uint16_t kVoltageSetpoint = 0x0030;
      static constexpr std::uint16_t kMeasuredVoltage = 0x0010;
      static constexpr std::uint16_t kMeasuredCurrent = 0x0011;
      static constexpr std::uint16_t kProtection = 0x0002;

      explicit FakeRegisterDevice(std::uint8_t slave = 1, double loadOhms = 10.0)
          : slave_(slave), loadOhms_(loadOhms) {
        registers_[0x0003] = 0x1234; // model
        registers_[0x0004] = 0x0002; // class
        registers_[0x0005] = 0x0232; // decimals: V 2, A 3, W 2
      }

      //---fault injection-------------------------------------------------------
      void setRegister(std::uint16_t address, std::uint16_t value) {
        std::lock_guard<std::mutex> lock(mtx_);
        registers_[address] = value;
      }
      std::uint16_t registerValue(std::uint16_t address) const {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = registers_.find(address);
        return it == registers_.end() ? 0 : it->second;
      }
      void silenceNext(int n) {
        std::lock_guard<std::mutex> lock(mtx_);
        silent_ += n;
      }
      /// The \p n th request from now (1 = the next one) gets no reply.
      void silenceNth(int n) {
        std::lock_guard<std::mutex> lock(mtx_);
        silenceAt_ = requests_ + n;
      }
      /// Every \p n th request gets no reply (0 = off).
      void silenceEvery(int n) {
        std::lock_guard<std::mutex> lock(mtx_);
        silenceEvery_ = n;
      }
      void corruptNext(int n) {
        std::lock_guard<std::mutex> lock(mtx_);
        corrupt_ += n;
      }
      void exceptionNext(std::uint8_t code) {
        std::lock_guard<std::mutex> lock(mtx_);
        exception_ = code;
      }
      void setOffline(bool offline) {
        std::lock_guard<std::mutex> lock(mtx_);
        offline_ = offline;
      }
      /// Raw protection word the device reports from now on.
      void trip(std::uint16_t bits) { setRegister(kProtection, bits); }

      int requests() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
      }
      /// Setpoint words written to 0x0030, in order.
      std::vector<std::uint16_t> setpointHistory() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return setpoints_;
      }

      //---SerialChannel---------------------------------------------------------
      bool open(const std::string&, speed_t) override { return true; }
      bool isOpen() const override { return true; }

      void discardInput() override {
        std::lock_guard<std::mutex> lock(mtx_);
        rx_.clear();
      }

      std::optional<std::vector<std::uint8_t>> read(std::size_t count,
                                                    std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mtx_);
        if (rx_.size() < count)
          return std::nullopt;
        std::vector<std::uint8_t> out(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(count));
        rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(count));
        return out;
      }

      bool write(std::span<const std::uint8_t> request) override {
        std::lock_guard<std::mutex> lock(mtx_);
        ++requests_;
        if (offline_)
          return true;
        if (silenceEvery_ > 0 && requests_ % silenceEvery_ == 0)
          return true;
        if (silent_ > 0) {
          --silent_;
          return true;
        }
        if (silenceAt_ == requests_) {
          silenceAt_ = 0;
          return true;
        }
        if (request.size() < 8 || !protocols::hasValidCrc(request) || request[0] != slave_)
          return true;

        std::vector<std::uint8_t> reply = answer(request);
        if (corrupt_ > 0) {
          --corrupt_;
          reply.back() ^= 0xFF;
        }
        rx_.insert(rx_.end(), reply.begin(), reply.end());
        return true;
      }

    private:
      static std::uint16_t word(std::span<const std::uint8_t> f, std::size_t at) {
        return static_cast<std::uint16_t>((f[at] << 8) | f[at + 1]);
      }
      static void putWord(std::vector<std::uint8_t>& f, std::uint16_t w) {
        f.push_back(static_cast<std::uint8_t>(w >> 8));
        f.push_back(static_cast<std::uint8_t>(w & 0xFF));
      }
      static void seal(std::vector<std::uint8_t>& f) {
        const std::uint16_t crc = protocols::crc16(f);
        f.push_back(static_cast<std::uint8_t>(crc & 0xFF));
        f.push_back(static_cast<std::uint8_t>(crc >> 8));
      }

      void store(std::uint16_t address, std::uint16_t value) {
        registers_[address] = value;
        if (address == kVoltageSetpoint) {
          setpoints_.push_back(value);
          registers_[kMeasuredVoltage] = value;
          // V ×100 in, A ×1000 out
          const double amps = (value / 100.0) / loadOhms_;
          registers_[kMeasuredCurrent] = static_cast<std::uint16_t>(amps * 1000.0 + 0.5);
        }
      }

      std::vector<std::uint8_t> answer(std::span<const std::uint8_t> req) {
        const std::uint8_t function = req[1];
        std::vector<std::uint8_t> reply{ slave_ };

        if (exception_) {
          reply.push_back(static_cast<std::uint8_t>(function | protocols::kExceptionBit));
          reply.push_back(*exception_);
          exception_.reset();
          seal(reply);
          return reply;
        }

        reply.push_back(function);
        const std::uint16_t address = word(req, 2);
        switch (function) {
        case 0x03: {
          const std::uint16_t count = word(req, 4);
          reply.push_back(static_cast<std::uint8_t>(count * 2));
          for (std::uint16_t i = 0; i < count; ++i) {
            auto it = registers_.find(static_cast<std::uint16_t>(address + i));
            putWord(reply, it == registers_.end() ? 0 : it->second);
          }
          break;
        }
        case 0x06:
          store(address, word(req, 4));
          putWord(reply, address);
          putWord(reply, word(req, 4));
          break;
        case 0x10: {
          const std::uint16_t count = word(req, 4);
          for (std::uint16_t i = 0; i < count; ++i)
            store(static_cast<std::uint16_t>(address + i), word(req, 7 + 2 * i));
          putWord(reply, address);
          putWord(reply, count);
          break;
        }
        default:
          reply[1] = static_cast<std::uint8_t>(function | protocols::kExceptionBit);
          reply.push_back(0x01); // illegal function
          break;
        }
        seal(reply);
        return reply;
      }

      mutable std::mutex mtx_;
      std::uint8_t slave_;
      double loadOhms_;
      std::map<std::uint16_t, std::uint16_t> registers_;
      std::vector<std::uint16_t> setpoints_;
      std::vector<std::uint8_t> rx_;
      int requests_{ 0 };
      int silent_{ 0 };
      int silenceAt_{ 0 };
      int silenceEvery_{ 0 };
      int corrupt_{ 0 };
      std::optional<std::uint8_t> exception_;
      bool offline_{ false };
    };

  } // namespace test
} // namespace anod
