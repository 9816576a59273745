#pragma once
/** @file  StageSequencer.hpp
 *  @brief Ordered list of setpoint ramps and the cursor that walks through them.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <mutex>
#include <vector>

namespace anod {
  namespace core {

    struct Stage {
      double startValue{ 0.0 };
      double endValue{ 0.0 };
      double duration{ 0.0 }; ///< seconds, > 0
    };

    /// Result of one advance() call.
    struct StageTick {
      double target{ 0.0 };
      std::size_t stageIndex{ 0 };
      double elapsed{ 0.0 };      ///< within stageIndex, never above its duration
      bool stageChanged{ false }; ///< cursor moved to a new stage on this call
      bool complete{ false };     ///< last stage finished on this call
    };

    /**
 * @class StageSequencer
 * @brief Idle → Running(index, elapsed) → Complete.
 *
 *  * Stage edits only while Idle (InvalidStateError otherwise).
 *  * Crossing a stage boundary discards the overshoot: the next stage starts at
 *    elapsed 0, so long runs of short stages don't drift.
 *  * The target inside a stage is the linear ramp start + (end - start)·elapsed/duration.
 */
    class StageSequencer {
    public:
      enum class Phase { Idle, Running, Complete };

      StageSequencer() = default;

      //---editing (Idle only)--------------------------------------------------
      void addStage(const Stage& stage);
      void insertStage(std::size_t index, const Stage& stage);
      void replaceStage(std::size_t index, const Stage& stage);
      void removeStage(std::size_t index);
      void reorder(std::size_t from, std::size_t to);
      void clear();

      //---run------------------------------------------------------------------
      /// Running(0, 0); throws EmptySequenceError without stages.
      void start();
      StageTick advance(double dt);
      /// Back to Idle from any phase.
      void halt();

      /// Target at the current cursor without moving it.
      double currentTarget() const;

      Phase phase() const;
      std::vector<Stage> stages() const;
      std::size_t size() const;
      double totalDuration() const;

    private:
      static void check(const Stage& stage);
      void requireIdle(const char* op) const;
      double targetLocked() const;

      mutable std::mutex mtx_;
      std::vector<Stage> stages_;
      Phase phase_{ Phase::Idle };
      std::size_t index_{ 0 };
      double elapsed_{ 0.0 };
    };

    const char* toString(StageSequencer::Phase phase);

  } // namespace core
} // namespace anod
