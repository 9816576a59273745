#pragma once
/** @file  Sample.hpp
 *  @brief One control tick's record, shared read-only with plot & storage consumers.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <cstddef>
#include <cstdint>

#include "control/ControlStrategy.hpp"

namespace anod {
  namespace core {

    struct Sample {
      std::uint64_t sequence{ 0 }; ///< tick index since start, gaps = skipped ticks
      double timestamp{ 0.0 };     ///< seconds of experiment time, strictly increasing
      std::size_t stageIndex{ 0 };
      double target{ 0.0 };
      double measured{ 0.0 };        ///< controlled quantity (voltage)
      double controlSignal{ 0.0 };
      double measuredCurrent{ 0.0 };
      control::StrategyParameters strategy{}; ///< active_mode + gains snapshot
    };

  } // namespace core
} // namespace anod
