/* @file Logger.cpp
 * @brief event queue + worker thread writing timestamp,level,source,message rows
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>
#include <iostream>

// ANOD headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

using namespace anod::core;

namespace {
  std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    const auto secs = std::chrono::system_clock::to_time_t(tp);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[32];
    const auto len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    char out[48];
    std::snprintf(out, sizeof(out), "%.*s.%03dZ", static_cast<int>(len), buf,
                  static_cast<int>(ms));
    return out;
  }
} // namespace

namespace anod {
  namespace core {
    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARNING";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "UNKNOWN";
      }
    }
  } // namespace core
} // namespace anod

Logger::Logger(std::size_t queueCapacity, LogLevel echoLevel)
    : csvFile_(std::make_unique<io::FileLogger>()),
      buffer_(std::make_unique<RingBuffer<LogEvent>>(queueCapacity)), echoLevel_(echoLevel) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& path) {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (running_)
    return true;

  if (!csvFile_->open(path))
    return false;
  if (!csvFile_->write("timestamp,level,source,message\n") || !csvFile_->flush()) {
    csvFile_->close();
    return false;
  }

  buffer_->reopen();
  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
  return true;
}

void Logger::log(LogEvent event) {
  if (event.level >= echoLevel_)
    std::cerr << "[" << toString(event.level) << "] [" << event.source << "] " << event.message
              << "\n";
  if (!running_)
    return;
  buffer_->push(std::move(event));
}

void Logger::log(LogLevel level, std::string source, std::string message) {
  LogEvent event;
  event.level = level;
  event.source = std::move(source);
  event.message = std::move(message);
  log(std::move(event));
}

void Logger::finishRun() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (!running_)
    return;

  running_ = false;
  buffer_->close();
  if (worker_.joinable())
    worker_.join();

  // anything pushed between the worker's last pop and close()
  for (const auto& event : buffer_->drain())
    writeEvent(event);
  csvFile_->close();
}

std::uint64_t Logger::dropped() const { return buffer_->dropped(); }

void Logger::workerLoop() {
  while (running_) {
    if (auto event = buffer_->waitPop(std::chrono::milliseconds{ 100 }))
      writeEvent(*event);
  }
  for (const auto& event : buffer_->drain())
    writeEvent(event);
}

void Logger::writeEvent(const LogEvent& event) {
  const std::string row = isoTimestamp(event.timestamp) + "," + toString(event.level) + "," +
                          io::FileLogger::escape(event.source) + "," +
                          io::FileLogger::escape(event.message) + "\n";
  if (!csvFile_->write(row))
    std::cerr << "[Logger] failed to write event log " << csvFile_->path() << "\n";
}
