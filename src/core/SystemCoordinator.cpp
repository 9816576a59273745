/* @file SystemCoordinator.cpp
 * @brief boot, supply bring-up and the batch of experiments
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

// third-party
#include <nlohmann/json.hpp>

// ANOD headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Errors.hpp"
#include "core/ExperimentController.hpp"
#include "core/Logger.hpp"
#include "core/PowerSupply.hpp"
#include "core/RegisterClient.hpp"
#include "core/SampleDistributor.hpp"
#include "core/SystemCoordinator.hpp"
#include "io/SerialChannel.hpp"

using namespace anod::core;

namespace anod {
  namespace core {
    const char* toString(SystemCoordinator::State s) {
      switch (s) {
      case SystemCoordinator::State::BOOT:
        return "BOOT";
      case SystemCoordinator::State::INIT:
        return "INIT";
      case SystemCoordinator::State::IDLE:
        return "IDLE";
      case SystemCoordinator::State::RUNNING:
        return "RUNNING";
      case SystemCoordinator::State::FINISHED:
        return "FINISHED";
      case SystemCoordinator::State::ERROR:
        return "ERROR";
      default:
        return "Unknown";
      }
    }
  } // namespace core
} // namespace anod

namespace {
  void printSample(const Sample& s) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(3);
    os << "t=" << s.timestamp << "s stage " << s.stageIndex << "  target " << s.target
       << " V  measured " << s.measured << " V  " << s.measuredCurrent << " A  cmd "
       << s.controlSignal << " V\n";
    std::cout << os.str() << std::flush;
  }
} // namespace

SystemCoordinator::SystemCoordinator()
    : logger_(std::make_shared<Logger>()), errorMonitor_(std::make_shared<ErrorMonitor>()),
      plotHandler_(printSample) {}

SystemCoordinator::~SystemCoordinator() {
  if (controller_)
    controller_->stop();
  logger_->finishRun();
}

void SystemCoordinator::initialize(const std::string& configPath) {
  transitionTo(State::INIT);
  SystemConfig config;
  auto channel = std::make_unique<io::SerialChannel>();
  try {
    config = SystemConfig::fromJson(ConfigLoader(configPath).load());

    const auto baud = io::SerialChannel::baudFromInt(config.serial.baud);
    if (!baud)
      throw ValidationError("[SystemCoordinator] unsupported baud rate " +
                            std::to_string(config.serial.baud));
    if (!channel->open(config.serial.device, *baud))
      throw CommunicationError(CommunicationError::Cause::ChannelFailure,
                               "[SystemCoordinator] cannot open " + config.serial.device, 0);
  } catch (const std::exception& e) {
    handleError(e.what());
    throw;
  }
  initialize(config, std::move(channel));
}

void SystemCoordinator::initialize(const SystemConfig& config,
                                   std::unique_ptr<io::SerialChannel> channel) {
  transitionTo(State::INIT);
  try {
    config_ = config;
    if (!config_.eventLog.empty() && !logger_->startNewRun(config_.eventLog))
      std::cerr << "[SystemCoordinator] event log " << config_.eventLog
                << " not writable, continuing without it\n";

    errorMonitor_->registerEscalation([this](const std::string& reason) { handleError(reason); });

    client_ = std::make_shared<RegisterClient>(std::move(channel), config_.serial.client, logger_);
    bringUpSupply();

    distributor_ = std::make_shared<SampleDistributor>();
    plotQueue_ = distributor_->subscribe("plot", config_.plotCapacity);
    storageQueue_ = distributor_->subscribe("storage", config_.storageCapacity);
    controller_ =
        std::make_unique<ExperimentController>(supply_, distributor_, errorMonitor_, logger_);
  } catch (const std::exception& e) {
    handleError(e.what());
    throw;
  }
  transitionTo(State::IDLE);
}

bool SystemCoordinator::run() {
  if (state() != State::IDLE)
    throw InvalidStateError(std::string("[SystemCoordinator] run() while ") + toString(state()));

  transitionTo(State::RUNNING);
  results_.clear();
  bool allCompleted = true;

  for (std::size_t i = 0; i < config_.experiments.size(); ++i) {
    if (abortRequested_) {
      log(LogLevel::Warning, "batch aborted, " + std::to_string(config_.experiments.size() - i) +
                                 " experiment(s) skipped");
      allCompleted = false;
      break;
    }

    const auto& plan = config_.experiments[i];
    log(LogLevel::Info, "experiment " + std::to_string(i + 1) + "/" +
                            std::to_string(config_.experiments.size()) + ": " + plan.name);
    auto result = runExperiment(plan);
    if (result.state == RunState::Faulted)
      log(LogLevel::Warning, "setpoint left at its last value after the fault");
    else
      zeroSetpoint();

    if (result.state != RunState::Stopped)
      allCompleted = false;
    results_.push_back(std::move(result));

    if (i + 1 < config_.experiments.size())
      pauseBetweenRuns();
  }

  transitionTo(allCompleted ? State::FINISHED : State::ERROR);
  return allCompleted;
}

void SystemCoordinator::handleAbort() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    abortRequested_ = true;
  }
  abortCv_.notify_all();
  log(LogLevel::Warning, "abort requested");
  if (controller_)
    controller_->stop();
}

void SystemCoordinator::handleError(const std::string& reason) {
  log(LogLevel::Error, reason);
  std::lock_guard<std::mutex> lock(mtx_);
  // a faulted experiment inside a batch is reported through its ExperimentResult
  if (currentState_ != State::RUNNING)
    currentState_ = State::ERROR;
}

void SystemCoordinator::setPlotHandler(SampleConsumer::Handler handler) {
  plotHandler_ = std::move(handler);
}

SystemCoordinator::State SystemCoordinator::state() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return currentState_;
}

//---private---------------------------------------------------------------

void SystemCoordinator::transitionTo(State next) {
  State previous;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    previous = currentState_;
    currentState_ = next;
  }
  if (previous != next)
    log(LogLevel::Debug, std::string(toString(previous)) + " -> " + toString(next));
}

void SystemCoordinator::bringUpSupply() {
  RegisterMap map = RegisterMap::defaults();
  if (config_.device.probeScaling)
    map = PowerSupply::probeScaling(*client_, map);
  if (config_.device.voltageRange)
    map = map.withRange(Quantity::VoltageSetpoint, config_.device.voltageRange->first,
                        config_.device.voltageRange->second);
  if (config_.device.currentRange)
    map = map.withRange(Quantity::CurrentSetpoint, config_.device.currentRange->first,
                        config_.device.currentRange->second);

  supply_ = std::make_shared<PowerSupply>(client_, map);

  const auto info = supply_->identify();
  log(LogLevel::Info, "supply model " + std::to_string(info.model) + ", class " +
                          std::to_string(info.classCode));

  if (config_.device.overVoltage)
    supply_->set(Quantity::OverVoltageLimit, *config_.device.overVoltage);
  if (config_.device.overCurrent)
    supply_->set(Quantity::OverCurrentLimit, *config_.device.overCurrent);
  if (config_.device.currentLimit)
    supply_->set(Quantity::CurrentSetpoint, *config_.device.currentLimit);

  supply_->set(Quantity::VoltageSetpoint, 0.0);
  supply_->setOutputEnabled(config_.device.enableOutput);
}

ExperimentResult SystemCoordinator::runExperiment(const ExperimentPlan& plan) {
  ExperimentResult result;
  result.name = plan.name;

  ExperimentConfig config = plan.config;
  const auto& setpoint = supply_->registerMap().at(Quantity::VoltageSetpoint);
  if (std::isinf(config.strategy.outputMin))
    config.strategy.outputMin = setpoint.minValue;
  if (std::isinf(config.strategy.outputMax))
    config.strategy.outputMax = setpoint.maxValue;

  if (!plan.output.empty() && !recorder_.open(plan.output)) {
    result.state = RunState::Faulted;
    result.faultReason = "[SystemCoordinator] cannot create " + plan.output;
    handleError(result.faultReason);
    return result;
  }

  SampleConsumer plot(plotQueue_, plotHandler_, logger_);
  SampleConsumer storage(
      storageQueue_,
      [this](const Sample& s) {
        if (recorder_.isOpen())
          recorder_.record(s);
      },
      logger_);
  plotQueue_->drain();
  storageQueue_->drain();
  plot.start();
  storage.start();
  errorMonitor_->clear();

  bool started = false;
  try {
    auto& stages = controller_->stages();
    stages.clear();
    for (const auto& stage : plan.stages)
      stages.addStage(stage);
    controller_->start(config);
    started = true;
    if (abortRequested_)
      controller_->stop();

    while (!controller_->waitUntilFinished(std::chrono::milliseconds{ 200 })) {
    }
  } catch (const std::exception& e) {
    result.faultReason = e.what();
    handleError(result.faultReason);
  }

  plot.stop();
  storage.stop();
  if (recorder_.isOpen()) {
    if (!recorder_.flush())
      log(LogLevel::Error, "flush failed: " + plan.output);
    result.recorded = recorder_.rows();
    recorder_.close();
  }

  if (!started) {
    result.state = RunState::Faulted; // rejected before the first tick
  } else {
    result.state = controller_->state();
    result.ticks = controller_->ticks();
  }
  if (started && result.state == RunState::Faulted) {
    result.faultReason = controller_->faultReason();
    try {
      controller_->rethrowFault();
    } catch (const ProtectionFaultError& e) {
      log(LogLevel::Error, std::string("protection trip, ending batch: ") + e.what());
      abortRequested_ = true;
    } catch (const std::exception&) {
      // already logged by the controller; the batch continues
    }
  }

  log(result.state == RunState::Stopped ? LogLevel::Info : LogLevel::Error,
      plan.name + ": " + toString(result.state) + " after " + std::to_string(result.ticks) +
          " ticks, " + std::to_string(result.recorded) + " rows recorded");
  return result;
}

void SystemCoordinator::zeroSetpoint() {
  try {
    supply_->set(Quantity::VoltageSetpoint, 0.0);
  } catch (const CommunicationError& e) {
    log(LogLevel::Error, std::string("could not zero the voltage setpoint: ") + e.what());
  }
}

void SystemCoordinator::pauseBetweenRuns() {
  std::unique_lock<std::mutex> lock(mtx_);
  abortCv_.wait_for(lock, config_.pauseBetweenRuns, [this] { return abortRequested_.load(); });
}

void SystemCoordinator::log(LogLevel level, const std::string& message) {
  logger_->log(level, "SystemCoordinator", message);
}
