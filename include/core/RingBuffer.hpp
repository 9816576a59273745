#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, lock-protected SPSC queue that overwrites its oldest entry when full.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace anod {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO used wherever a producer must never wait on a consumer.
 *
 *  * `push()` never blocks beyond the internal mutex; on overflow the oldest entry is
 *    dropped and counted.
 *  * `tryPop()` is non-blocking; `waitPop()` lets consumer threads sleep until data or
 *    `close()` arrives.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be > 0");
      }

      /// @returns false when an older entry had to be dropped to make room.
      bool push(T item) {
        bool kept = true;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (count_ == slots_.size()) {
            head_ = (head_ + 1) % slots_.size();
            --count_;
            ++dropped_;
            kept = false;
          }
          slots_[(head_ + count_) % slots_.size()] = std::move(item);
          ++count_;
        }
        cv_.notify_one();
        return kept;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return popLocked();
      }

      /// Blocks up to \p timeout; std::nullopt on timeout or when closed and empty.
      std::optional<T> waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return count_ > 0 || closed_; });
        return popLocked();
      }

      /// Removes and returns everything currently queued, oldest first.
      std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<T> out;
        out.reserve(count_);
        while (auto item = popLocked())
          out.push_back(std::move(*item));
        return out;
      }

      /// Wakes any waiter; further pushes are still accepted.
      void close() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          closed_ = true;
        }
        cv_.notify_all();
      }

      void reopen() {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = false;
      }

      bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return count_;
      }

      std::size_t capacity() const { return slots_.size(); }

      std::uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
      }

    private:
      std::optional<T> popLocked() {
        if (count_ == 0)
          return std::nullopt;
        std::optional<T> item = std::move(slots_[head_]);
        slots_[head_].reset();
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
      }

      mutable std::mutex mtx_;
      std::condition_variable cv_;
      std::vector<std::optional<T>> slots_;
      std::size_t head_{ 0 };
      std::size_t count_{ 0 };
      std::uint64_t dropped_{ 0 };
      bool closed_{ false };
    };

  } // namespace core
} // namespace anod
