#pragma once

/** @file  SystemCoordinator.hpp
 *  @brief Public API for anod::core::SystemCoordinator.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/SampleConsumer.hpp"
#include "core/SampleRecorder.hpp"
#include "core/SystemConfig.hpp"

namespace anod {
  namespace io {
    class SerialChannel;
  } // namespace io

  namespace core {

    class ErrorMonitor;
    class PowerSupply;
    class RegisterClient;
    class SampleDistributor;
    class SampleQueue;

    /// Outcome of one configured experiment.
    struct ExperimentResult {
      std::string name;
      RunState state{ RunState::Idle };
      std::uint64_t ticks{ 0 };
      std::uint64_t recorded{ 0 }; ///< CSV rows written
      std::string faultReason{};
    };

    /**
 * @class SystemCoordinator
 * @brief Top-level FSM: wires serial link, device, controller and consumers, then runs
 *        the configured experiments back to back.
 *
 *  BOOT → INIT → IDLE → RUNNING → FINISHED, or ERROR when initialisation fails, a
 *  protection trip ends the batch, or an experiment faults.
 *
 *  * A fault ends that experiment only; the batch moves on after the setpoint is zeroed.
 *    Protection trips and handleAbort() end the whole batch.
 *  * `handleAbort()` is safe to call from any thread (signal watcher, escalation).
 */
    class SystemCoordinator {

    public:
      enum class State { BOOT, INIT, IDLE, RUNNING, FINISHED, ERROR };

      SystemCoordinator();
      ~SystemCoordinator();

      /// Load \p configPath, open the serial device named there, bring the supply up.
      void initialize(const std::string& configPath);
      /// Same, with an already opened channel (replays, tests).
      void initialize(const SystemConfig& config, std::unique_ptr<io::SerialChannel> channel);

      /// Runs every configured experiment. @returns true when all of them completed.
      bool run();

      void handleAbort(); ///< Stop the current run and skip the rest of the batch
      void handleError(const std::string& reason);

      /// Replaces the live readout fed from the plot queue (default: one line per sample on stdout).
      void setPlotHandler(SampleConsumer::Handler handler);

      State state() const;
      const std::vector<ExperimentResult>& results() const { return results_; }
      std::shared_ptr<PowerSupply> supply() const { return supply_; }

      SystemCoordinator(const SystemCoordinator&) = delete;
      SystemCoordinator& operator=(const SystemCoordinator&) = delete;

    private:
      void transitionTo(State next);
      void bringUpSupply();
      ExperimentResult runExperiment(const ExperimentPlan& plan);
      void zeroSetpoint();
      void pauseBetweenRuns();
      void log(LogLevel level, const std::string& message);

      SystemConfig config_{};
      std::shared_ptr<Logger> logger_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<RegisterClient> client_;
      std::shared_ptr<PowerSupply> supply_;
      std::shared_ptr<SampleDistributor> distributor_;
      std::shared_ptr<SampleQueue> plotQueue_;
      std::shared_ptr<SampleQueue> storageQueue_;
      std::unique_ptr<ExperimentController> controller_;
      SampleConsumer::Handler plotHandler_;
      SampleRecorder recorder_;
      std::vector<ExperimentResult> results_;

      mutable std::mutex mtx_;
      std::condition_variable abortCv_;
      State currentState_{ State::BOOT };
      std::atomic<bool> abortRequested_{ false };
    };

    const char* toString(SystemCoordinator::State s);

  } // namespace core
} // namespace anod
