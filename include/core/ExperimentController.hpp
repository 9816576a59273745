#pragma once
/** @file  ExperimentController.hpp
 *  @brief Fixed-period sampling loop: measure → target → control → command → publish.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// ANOD headers
#include "control/ControlStrategy.hpp"
#include "core/Logger.hpp"
#include "core/StageSequencer.hpp"
#include "core/StrategyFactory.hpp"

namespace anod {
  namespace core {

    class ErrorMonitor;
    class PowerSupply;
    class SampleDistributor;
    class CommunicationError;

    enum class RunState : std::uint8_t { Idle, Running, Stopping, Stopped, Faulted };

    const char* toString(RunState s);

    struct ExperimentConfig {
      std::chrono::milliseconds samplingInterval{ 1000 };
      control::StrategyParameters strategy{};
      int failureThreshold{ 3 }; ///< consecutive failed ticks tolerated before Faulted
    };

    /**
 * @class ExperimentController
 * @brief Owns the run state machine, the StageSequencer and the active ControlStrategy.
 *
 *  Idle → Running → Stopping → Stopped, or Running → Faulted on an unrecoverable error.
 *
 *  * `start()` runs ticks on an internal thread at the configured period; `arm()` +
 *    `step()` let a caller drive ticks itself (batch replays, tests).
 *  * A CommunicationError skips the rest of the tick and the next tick retries the
 *    same target; more than `failureThreshold` in a row faults the run.
 *  * Protection trips, rejected commands and any other error fault the run at once:
 *    no further writes, reason retained until the next start.
 *  * Sequencer and strategy are only touched by the ticking thread.
 */
    class ExperimentController {
    public:
      ExperimentController(std::shared_ptr<PowerSupply> supply,
                           std::shared_ptr<SampleDistributor> distributor,
                           std::shared_ptr<ErrorMonitor> errMonitor,
                           std::shared_ptr<Logger> logger = nullptr,
                           StrategyFactory factory = StrategyFactory::withDefaults());
      ~ExperimentController(); ///< stop + join

      //---public API-------------------------------------------------------
      /// Stage list; edits throw InvalidStateError unless the controller is idle.
      StageSequencer& stages() { return sequencer_; }
      const StageSequencer& stages() const { return sequencer_; }

      /// Validate, reset sequencer + strategy, go Running and tick on the internal thread.
      void start(const ExperimentConfig& config);

      /// Same validation and reset, but no thread: the caller invokes step().
      void arm(const ExperimentConfig& config);

      /// One tick. @returns true while the run continues.
      bool step();

      /// Running → Stopping → Stopped once the in-flight tick is done. Idempotent.
      void stop();

      /// Blocks until Stopped or Faulted (or timeout). @returns true if finished.
      bool waitUntilFinished(std::chrono::milliseconds timeout);

      RunState state() const;
      std::string faultReason() const;
      /// Rethrows the error that faulted the run (ProtectionFaultError, CommunicationError, ...).
      void rethrowFault() const;

      int consecutiveFailures() const;
      std::uint64_t ticks() const;
      const ExperimentConfig& config() const { return config_; }

      ExperimentController(const ExperimentController&) = delete;
      ExperimentController& operator=(const ExperimentController&) = delete;

    private:
      void prepare(const ExperimentConfig& config);
      void validate(const ExperimentConfig& config) const;
      void runLoop();
      bool tick();
      bool onCommunicationFailure(const CommunicationError& e);
      void fault(std::exception_ptr error, const std::string& reason);
      void finish();
      void joinWorker();
      void log(LogLevel level, const std::string& message);

      std::shared_ptr<PowerSupply> supply_;
      std::shared_ptr<SampleDistributor> distributor_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> logger_;
      StrategyFactory factory_;

      StageSequencer sequencer_;
      std::unique_ptr<control::ControlStrategy> strategy_;
      ExperimentConfig config_{};
      std::optional<StageTick> pendingTick_; ///< advanced, not yet commanded

      mutable std::mutex stateMtx_;
      std::condition_variable stateCv_;
      RunState state_{ RunState::Idle };
      bool stopRequested_{ false };
      std::string faultReason_{};
      std::exception_ptr fault_{};

      std::atomic<int> consecutiveFailures_{ 0 };
      std::atomic<std::uint64_t> ticks_{ 0 };
      std::thread worker_;
    };

  } // namespace core
} // namespace anod
