/* @file SampleConsumer.cpp
 * @brief queue → handler worker
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <chrono>
#include <stdexcept>
#include <string>

#include "core/Logger.hpp"
#include "core/SampleConsumer.hpp"
#include "core/SampleDistributor.hpp"

using namespace anod::core;

SampleConsumer::SampleConsumer(std::shared_ptr<SampleQueue> queue, Handler handler,
                               std::shared_ptr<Logger> logger)
    : queue_(std::move(queue)), handler_(std::move(handler)), logger_(std::move(logger)) {
  if (!queue_ || !handler_)
    throw std::invalid_argument("[SampleConsumer] queue and handler are required");
}

SampleConsumer::~SampleConsumer() { stop(); }

void SampleConsumer::start() {
  if (running_.exchange(true))
    return;
  queue_->reopen();
  worker_ = std::thread(&SampleConsumer::workerLoop, this);
}

void SampleConsumer::stop() {
  if (!running_.exchange(false))
    return;
  queue_->close();
  if (worker_.joinable())
    worker_.join();

  for (const auto& sample : queue_->drain())
    deliver(sample);
}

void SampleConsumer::workerLoop() {
  while (running_) {
    if (auto sample = queue_->waitPoll(std::chrono::milliseconds{ 100 }))
      deliver(*sample);
  }
}

void SampleConsumer::deliver(const Sample& sample) {
  try {
    handler_(sample);
    ++consumed_;
  } catch (const std::exception& e) {
    ++failures_;
    if (logger_)
      logger_->log(LogLevel::Error, "SampleConsumer:" + queue_->name(),
                   "sample " + std::to_string(sample.sequence) + " not handled: " + e.what());
  }
}
