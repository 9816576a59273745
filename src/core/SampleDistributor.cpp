/* @file SampleDistributor.cpp
 * @brief subscription list + drop-oldest publish
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <algorithm>
#include <stdexcept>

#include "core/SampleDistributor.hpp"

using namespace anod::core;

std::shared_ptr<SampleQueue> SampleDistributor::subscribe(const std::string& name,
                                                          std::size_t capacity) {
  std::lock_guard<std::mutex> lock(mtx_);
  auto same = [&name](const auto& q) { return q->name() == name; };
  if (std::any_of(queues_.begin(), queues_.end(), same))
    throw std::invalid_argument("[SampleDistributor] duplicate subscriber: " + name);

  auto queue = std::make_shared<SampleQueue>(name, capacity);
  queues_.push_back(queue);
  return queue;
}

void SampleDistributor::unsubscribe(const std::string& name) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::erase_if(queues_, [&name](const auto& q) { return q->name() == name; });
}

void SampleDistributor::publish(const Sample& sample) {
  std::lock_guard<std::mutex> lock(mtx_);
  ++published_;
  for (auto& q : queues_)
    q->push(sample);
}

std::uint64_t SampleDistributor::published() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return published_;
}

std::size_t SampleDistributor::subscribers() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queues_.size();
}
