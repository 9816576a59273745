/* @file StrategyFactory.cpp
 * @brief name → creator registry for control strategies
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <stdexcept>

#include "control/FeedforwardStrategy.hpp"
#include "control/LinearStrategy.hpp"
#include "control/PidStrategy.hpp"
#include "core/StrategyFactory.hpp"

using namespace anod::core;
using namespace anod::control;

StrategyFactory StrategyFactory::withDefaults() {
  StrategyFactory factory;
  factory.registerStrategy(toString(ControlMode::Linear), [](const StrategyParameters &) {
    return std::make_unique<LinearStrategy>();
  });
  factory.registerStrategy(toString(ControlMode::Pid), [](const StrategyParameters &p) {
    return std::make_unique<PidStrategy>(p);
  });
  factory.registerStrategy(toString(ControlMode::Feedforward), [](const StrategyParameters &p) {
    return std::make_unique<FeedforwardStrategy>(p);
  });
  return factory;
}

bool StrategyFactory::registerStrategy(const std::string &name, Creator maker) {
  return creators_.emplace(name, std::move(maker)).second;
}

std::unique_ptr<ControlStrategy> StrategyFactory::create(const std::string &name,
                                                         const StrategyParameters &params) const {
  auto it = creators_.find(name);
  if (it == creators_.end())
    throw std::out_of_range("[StrategyFactory] unknown strategy: " + name);
  return it->second(params);
}

std::unique_ptr<ControlStrategy> StrategyFactory::create(const StrategyParameters &params) const {
  return create(toString(params.mode), params);
}
