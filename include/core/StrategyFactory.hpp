#pragma once
/** @file  StrategyFactory.hpp
 *  @brief Runtime registry that maps control mode names to creators.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

#include "control/ControlStrategy.hpp"

namespace anod::core {

  /**
 * @class StrategyFactory
 * @brief Register & instantiate control strategies by mode name.
 *
 *  * Keeps ExperimentController decoupled from concrete control laws.
 *  * Creators are lambdas returning `unique_ptr<ControlStrategy>`.
 */
  class StrategyFactory {
  public:
    using Creator =
        std::function<std::unique_ptr<control::ControlStrategy>(const control::StrategyParameters&)>;

    /// Factory with "linear", "pid" and "feedforward" registered.
    static StrategyFactory withDefaults();

    /// Register a strategy under \p name.  Returns false on duplicate.
    bool registerStrategy(const std::string &name, Creator maker);

    bool knows(const std::string &name) const { return creators_.count(name) != 0; }

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<control::ControlStrategy> create(const std::string &name,
                                                     const control::StrategyParameters &params) const;

    /// Same, keyed by `params.mode`.
    std::unique_ptr<control::ControlStrategy> create(const control::StrategyParameters &params) const;

  private:
    std::unordered_map<std::string, Creator> creators_;
  };

} // namespace anod::core
