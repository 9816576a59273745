/* @file ExperimentController.cpp
 * @brief run state machine and the per-tick measure/control/publish sequence
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <sstream>
#include <stdexcept>

// ANOD headers
#include "core/Errors.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ExperimentController.hpp"
#include "core/PowerSupply.hpp"
#include "core/Sample.hpp"
#include "core/SampleDistributor.hpp"

using namespace anod::core;

namespace anod {
  namespace core {
    const char* toString(RunState s) {
      switch (s) {
      case RunState::Idle:
        return "Idle";
      case RunState::Running:
        return "Running";
      case RunState::Stopping:
        return "Stopping";
      case RunState::Stopped:
        return "Stopped";
      case RunState::Faulted:
        return "Faulted";
      default:
        return "Unknown";
      }
    }
  } // namespace core
} // namespace anod

ExperimentController::ExperimentController(std::shared_ptr<PowerSupply> supply,
                                           std::shared_ptr<SampleDistributor> distributor,
                                           std::shared_ptr<ErrorMonitor> errMonitor,
                                           std::shared_ptr<Logger> logger,
                                           StrategyFactory factory)
    : supply_(std::move(supply)), distributor_(std::move(distributor)),
      errorMonitor_(std::move(errMonitor)), logger_(std::move(logger)),
      factory_(std::move(factory)) {
  if (!supply_ || !distributor_ || !errorMonitor_)
    throw std::invalid_argument("[ExperimentController] supply, distributor and error monitor are required");
}

ExperimentController::~ExperimentController() {
  stop();
  joinWorker();
}

void ExperimentController::start(const ExperimentConfig& config) {
  prepare(config);
  // stop() reads worker_ under stateMtx_; runLoop() takes the same lock before its first tick
  std::lock_guard<std::mutex> lock(stateMtx_);
  worker_ = std::thread(&ExperimentController::runLoop, this);
}

void ExperimentController::arm(const ExperimentConfig& config) { prepare(config); }

bool ExperimentController::step() {
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    if (state_ != RunState::Running)
      return false;
  }

  try {
    return tick();
  } catch (const std::exception& e) {
    fault(std::current_exception(), e.what());
    return false;
  }
}

void ExperimentController::stop() {
  bool threaded = false;
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    if (state_ != RunState::Running)
      return;
    state_ = RunState::Stopping;
    stopRequested_ = true;
    threaded = worker_.joinable();
  }
  stateCv_.notify_all();
  log(LogLevel::Info, "stop requested");

  if (threaded)
    joinWorker(); // worker finishes its in-flight tick, then finish()
  else
    finish();
}

bool ExperimentController::waitUntilFinished(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(stateMtx_);
  return stateCv_.wait_for(lock, timeout, [this] {
    return state_ == RunState::Stopped || state_ == RunState::Faulted || state_ == RunState::Idle;
  });
}

RunState ExperimentController::state() const {
  std::lock_guard<std::mutex> lock(stateMtx_);
  return state_;
}

std::string ExperimentController::faultReason() const {
  std::lock_guard<std::mutex> lock(stateMtx_);
  return faultReason_;
}

void ExperimentController::rethrowFault() const {
  std::exception_ptr error;
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    error = fault_;
  }
  if (error)
    std::rethrow_exception(error);
}

int ExperimentController::consecutiveFailures() const { return consecutiveFailures_.load(); }

std::uint64_t ExperimentController::ticks() const { return ticks_.load(); }

//---private---------------------------------------------------------------

void ExperimentController::prepare(const ExperimentConfig& config) {
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    if (state_ == RunState::Running || state_ == RunState::Stopping)
      throw InvalidStateError(std::string("[ExperimentController] start while ") +
                              toString(state_));
  }
  joinWorker(); // previous run's thread has already left runLoop()

  validate(config);

  sequencer_.halt();
  sequencer_.start();
  auto strategy = factory_.create(config.strategy);
  strategy->reset();
  strategy_ = std::move(strategy);
  config_ = config;
  consecutiveFailures_ = 0;
  ticks_ = 0;
  pendingTick_.reset();

  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    state_ = RunState::Running;
    stopRequested_ = false;
    faultReason_.clear();
    fault_ = nullptr;
  }

  std::ostringstream os;
  os << "run started: " << sequencer_.size() << " stages, " << sequencer_.totalDuration()
     << " s, interval " << config_.samplingInterval.count() << " ms, mode "
     << control::toString(config_.strategy.mode);
  log(LogLevel::Info, os.str());
}

void ExperimentController::validate(const ExperimentConfig& config) const {
  if (config.samplingInterval.count() <= 0)
    throw ValidationError("[ExperimentController] sampling interval must be > 0");
  if (config.failureThreshold < 0)
    throw ValidationError("[ExperimentController] failure threshold must be >= 0");

  control::validate(config.strategy);
  if (!factory_.knows(control::toString(config.strategy.mode)))
    throw ValidationError(std::string("[ExperimentController] no strategy registered for ") +
                          control::toString(config.strategy.mode));

  const auto stages = sequencer_.stages();
  if (stages.empty())
    throw EmptySequenceError();

  // every ramp endpoint must be a command the supply would accept
  const auto& spec = supply_->registerMap().at(Quantity::VoltageSetpoint);
  for (std::size_t i = 0; i < stages.size(); ++i) {
    for (double v : { stages[i].startValue, stages[i].endValue }) {
      if (v < spec.minValue || v > spec.maxValue) {
        std::ostringstream os;
        os << "[ExperimentController] stage " << i << " target " << v << " outside ["
           << spec.minValue << ", " << spec.maxValue << "]";
        throw ValidationError(os.str());
      }
    }
  }
}

void ExperimentController::runLoop() {
  auto next = std::chrono::steady_clock::now();
  while (step()) {
    next += config_.samplingInterval;
    std::unique_lock<std::mutex> lock(stateMtx_);
    if (stateCv_.wait_until(lock, next, [this] { return stopRequested_; }))
      break;
  }
  finish();
}

bool ExperimentController::tick() {
  const std::uint64_t index = ticks_++;
  const double dt = std::chrono::duration<double>(config_.samplingInterval).count();

  // 1. measure
  double voltage = 0.0;
  double current = 0.0;
  try {
    voltage = supply_->get(Quantity::MeasuredVoltage);
    current = supply_->get(Quantity::MeasuredCurrent);
  } catch (const CommunicationError& e) {
    return onCommunicationFailure(e);
  }

  // 2./3. target, strategy reset on stage change; a tick whose I/O failed keeps its target
  if (!pendingTick_) {
    pendingTick_ = sequencer_.advance(dt);
    if (pendingTick_->stageChanged) {
      strategy_->reset();
      log(LogLevel::Info, "entered stage " + std::to_string(pendingTick_->stageIndex));
    }
  }
  const StageTick target = *pendingTick_;

  // 4./5. control + command, 6. protection check
  const double command = strategy_->compute(target.target, voltage, dt);
  ProtectionFlags flags;
  try {
    supply_->set(Quantity::VoltageSetpoint, command);
    flags = supply_->readProtectionFlags();
  } catch (const CommunicationError& e) {
    return onCommunicationFailure(e);
  }

  if (!flags.empty()) {
    ProtectionFaultError error(flags);
    fault(std::make_exception_ptr(error), error.what());
    return false;
  }
  consecutiveFailures_ = 0;
  pendingTick_.reset();

  // 7. publish
  Sample sample;
  sample.sequence = index;
  sample.timestamp = static_cast<double>(index + 1) * dt;
  sample.stageIndex = target.stageIndex;
  sample.target = target.target;
  sample.measured = voltage;
  sample.controlSignal = command;
  sample.measuredCurrent = current;
  sample.strategy = config_.strategy;
  distributor_->publish(sample);

  if (target.complete) {
    {
      std::lock_guard<std::mutex> lock(stateMtx_);
      if (state_ == RunState::Running)
        state_ = RunState::Stopping;
    }
    log(LogLevel::Info, "last stage complete");
    finish();
    return false;
  }
  return true;
}

bool ExperimentController::onCommunicationFailure(const CommunicationError& e) {
  const int failures = ++consecutiveFailures_;
  if (failures > config_.failureThreshold) {
    fault(std::current_exception(),
          "[ExperimentController] " + std::to_string(failures) +
              " consecutive communication failures, last: " + e.what());
    return false;
  }
  log(LogLevel::Warning, "tick skipped (" + std::to_string(failures) + "/" +
                             std::to_string(config_.failureThreshold) + "): " + e.what());
  return true;
}

void ExperimentController::fault(std::exception_ptr error, const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    if (state_ != RunState::Running && state_ != RunState::Stopping)
      return;
    state_ = RunState::Faulted;
    stopRequested_ = true;
    faultReason_ = reason;
    fault_ = std::move(error);
    sequencer_.halt();
  }
  stateCv_.notify_all();
  log(LogLevel::Error, "run faulted: " + reason);
  errorMonitor_->notifyFailure(reason);
}

void ExperimentController::finish() {
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    if (state_ != RunState::Stopping)
      return;
    state_ = RunState::Stopped;
    sequencer_.halt();
  }
  stateCv_.notify_all();
  log(LogLevel::Info, "run stopped after " + std::to_string(ticks_.load()) + " ticks");
}

void ExperimentController::joinWorker() {
  if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
    worker_.join();
}

void ExperimentController::log(LogLevel level, const std::string& message) {
  if (logger_)
    logger_->log(level, "ExperimentController", message);
}
