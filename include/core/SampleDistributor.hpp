#pragma once
/** @file  SampleDistributor.hpp
 *  @brief Fan-out of each Sample to bounded per-consumer queues.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/RingBuffer.hpp"
#include "core/Sample.hpp"

namespace anod {
  namespace core {

    /// Consumer end of one subscription (single consumer).
    class SampleQueue {
    public:
      SampleQueue(std::string name, std::size_t capacity) : name_(std::move(name)), buffer_(capacity) {}

      /// Non-blocking; std::nullopt when empty.
      std::optional<Sample> poll() { return buffer_.tryPop(); }
      std::optional<Sample> waitPoll(std::chrono::milliseconds timeout) { return buffer_.waitPop(timeout); }
      std::vector<Sample> drain() { return buffer_.drain(); }

      const std::string& name() const { return name_; }
      std::size_t size() const { return buffer_.size(); }
      std::size_t capacity() const { return buffer_.capacity(); }
      std::uint64_t dropped() const { return buffer_.dropped(); }

      /// Wakes a consumer blocked in waitPoll(); used on shutdown.
      void close() { buffer_.close(); }
      void reopen() { buffer_.reopen(); }
      bool closed() const { return buffer_.closed(); }

    private:
      friend class SampleDistributor;
      bool push(const Sample& s) { return buffer_.push(s); }

      std::string name_;
      RingBuffer<Sample> buffer_;
    };

    /**
 * @class SampleDistributor
 * @brief Producer side: `publish()` copies the sample into every queue.
 *
 *  * Full queues drop their oldest entry; the control loop never waits on a consumer.
 *  * Order is preserved per queue; a consumer may see gaps, never reordering.
 */
    class SampleDistributor {
    public:
      /// New queue named e.g. "plot" or "storage"; throws std::invalid_argument on duplicates.
      std::shared_ptr<SampleQueue> subscribe(const std::string& name, std::size_t capacity);
      void unsubscribe(const std::string& name);

      void publish(const Sample& sample);

      std::uint64_t published() const;
      std::size_t subscribers() const;

    private:
      mutable std::mutex mtx_;
      std::vector<std::shared_ptr<SampleQueue>> queues_;
      std::uint64_t published_{ 0 };
    };

  } // namespace core
} // namespace anod
