#pragma once
/** @file  SampleConsumer.hpp
 *  @brief Worker thread draining one SampleQueue into a handler (plot, storage).
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

#include "core/Sample.hpp"

namespace anod {
  namespace core {

    class Logger;
    class SampleQueue;

    /**
 * @class SampleConsumer
 * @brief Runs `handler` for each sample on its own thread, at the consumer's pace.
 *
 *  * A handler that throws is logged and counted; the next sample is still delivered.
 *  * `stop()` delivers whatever is still queued before joining.
 */
    class SampleConsumer {
    public:
      using Handler = std::function<void(const Sample&)>;

      SampleConsumer(std::shared_ptr<SampleQueue> queue, Handler handler,
                     std::shared_ptr<Logger> logger = nullptr);
      ~SampleConsumer(); ///< stop()

      void start(); ///< launch worker thread
      void stop();  ///< drain + join

      bool running() const { return running_.load(); }
      std::uint64_t consumed() const { return consumed_.load(); }
      std::uint64_t failures() const { return failures_.load(); }

      SampleConsumer(const SampleConsumer&) = delete;
      SampleConsumer& operator=(const SampleConsumer&) = delete;

    private:
      void workerLoop();
      void deliver(const Sample& sample);

      std::shared_ptr<SampleQueue> queue_;
      Handler handler_;
      std::shared_ptr<Logger> logger_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::uint64_t> consumed_{ 0 };
      std::atomic<std::uint64_t> failures_{ 0 };
    };

  } // namespace core
} // namespace anod
