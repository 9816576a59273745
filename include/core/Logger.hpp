#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV event logger (runs its own worker thread).
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace anod {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warning, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{ std::chrono::system_clock::now() };
      LogLevel level{ LogLevel::Info };
      std::string source;  ///< component, e.g. "RegisterClient"
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Producers enqueue, one worker thread formats and writes.
 *
 *  * `log()` never blocks the caller beyond a mutex; when the queue is full the
 *    oldest event is dropped.
 *  * Events at or above `echoLevel` are mirrored to stderr as they are logged.
 *  * Events logged while no run is open are discarded.
 */
    class Logger {

    public:
      explicit Logger(std::size_t queueCapacity = 1024, LogLevel echoLevel = LogLevel::Warning);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& path); ///< open file + launch worker thread
      void log(LogEvent event);                  ///< enqueue event (non-blocking)
      void log(LogLevel level, std::string source, std::string message);
      void finishRun();                          ///< flush + join worker thread

      bool running() const { return running_.load(); }
      std::uint64_t dropped() const;

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void writeEvent(const LogEvent& event);

      std::unique_ptr<io::FileLogger> csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      LogLevel echoLevel_;
      std::mutex lifecycleMtx_;
    };

  } // namespace core
} // namespace anod
