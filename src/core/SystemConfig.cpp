/* @file SystemConfig.cpp
 * @brief JSON schema → typed config, with range checks
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <cmath>
#include <string>

#include <nlohmann/json.hpp>

#include "core/Errors.hpp"
#include "core/SystemConfig.hpp"

using namespace anod::core;
using nlohmann::json;

namespace {

  std::pair<double, double> parseRange(const json& j, const char* key) {
    const auto& r = j.at(key);
    if (!r.is_array() || r.size() != 2)
      throw ValidationError(std::string("[SystemConfig] ") + key + " must be [min, max]");
    const double lo = r.at(0).get<double>();
    const double hi = r.at(1).get<double>();
    if (!(lo <= hi))
      throw ValidationError(std::string("[SystemConfig] ") + key + " min > max");
    return { lo, hi };
  }

  template <typename T> std::optional<T> optionalValue(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null())
      return std::nullopt;
    return j.at(key).get<T>();
  }

  anod::control::StrategyParameters parseStrategy(const json& j) {
    anod::control::StrategyParameters p;
    const auto modeName = j.value("mode", std::string{ "linear" });
    const auto mode = anod::control::modeFromString(modeName);
    if (!mode)
      throw ValidationError("[SystemConfig] unknown strategy mode: " + modeName);
    p.mode = *mode;
    p.kp = j.value("kp", 0.0);
    p.ki = j.value("ki", 0.0);
    p.kd = j.value("kd", 0.0);
    p.kff = j.value("kff", 1.0);
    p.integralLimit = optionalValue<double>(j, "integral_limit");
    if (auto lo = optionalValue<double>(j, "output_min"))
      p.outputMin = *lo;
    if (auto hi = optionalValue<double>(j, "output_max"))
      p.outputMax = *hi;
    anod::control::validate(p);
    return p;
  }

  ExperimentPlan parseExperiment(const json& j, std::size_t index) {
    ExperimentPlan plan;
    plan.name = j.value("name", "experiment_" + std::to_string(index + 1));

    const double interval = j.value("sampling_interval_s", 1.0);
    if (!(interval > 0.0) || !std::isfinite(interval))
      throw ValidationError("[SystemConfig] " + plan.name + ": sampling_interval_s must be > 0");
    plan.config.samplingInterval =
        std::chrono::milliseconds{ static_cast<long long>(std::llround(interval * 1000.0)) };
    if (plan.config.samplingInterval.count() <= 0)
      throw ValidationError("[SystemConfig] " + plan.name + ": sampling interval below 1 ms");

    plan.config.failureThreshold = j.value("failure_threshold", 3);
    if (plan.config.failureThreshold < 0)
      throw ValidationError("[SystemConfig] " + plan.name + ": failure_threshold must be >= 0");

    if (j.contains("strategy"))
      plan.config.strategy = parseStrategy(j.at("strategy"));

    const auto& stages = j.at("stages");
    if (!stages.is_array() || stages.empty())
      throw ValidationError("[SystemConfig] " + plan.name + ": stages must be a non-empty array");
    for (const auto& s : stages) {
      Stage stage{ s.at("start").get<double>(), s.at("end").get<double>(),
                   s.at("duration_s").get<double>() };
      if (!(stage.duration > 0.0))
        throw ValidationError("[SystemConfig] " + plan.name + ": stage duration must be > 0");
      plan.stages.push_back(stage);
    }

    plan.output = j.value("output", std::string{});
    return plan;
  }

} // namespace

SystemConfig SystemConfig::fromJson(const json& j) {
  SystemConfig cfg;
  try {
    if (j.contains("serial")) {
      const auto& s = j.at("serial");
      cfg.serial.device = s.value("device", cfg.serial.device);
      cfg.serial.baud = s.value("baud", cfg.serial.baud);
      const int slave = s.value("slave_address", 1);
      if (slave < 1 || slave > 247)
        throw ValidationError("[SystemConfig] serial.slave_address must be 1..247");
      cfg.serial.client.slaveAddress = static_cast<std::uint8_t>(slave);
      cfg.serial.client.timeout = std::chrono::milliseconds{ s.value("timeout_ms", 1000) };
      cfg.serial.client.maxAttempts = s.value("max_attempts", 3);
      if (cfg.serial.client.timeout.count() <= 0 || cfg.serial.client.maxAttempts < 1)
        throw ValidationError("[SystemConfig] serial.timeout_ms and max_attempts must be > 0");
    }

    if (j.contains("device")) {
      const auto& d = j.at("device");
      cfg.device.probeScaling = d.value("probe_scaling", true);
      if (d.contains("voltage_range"))
        cfg.device.voltageRange = parseRange(d, "voltage_range");
      if (d.contains("current_range"))
        cfg.device.currentRange = parseRange(d, "current_range");
      cfg.device.overVoltage = optionalValue<double>(d, "over_voltage");
      cfg.device.overCurrent = optionalValue<double>(d, "over_current");
      cfg.device.currentLimit = optionalValue<double>(d, "current_limit");
      cfg.device.enableOutput = d.value("enable_output", true);
    }

    if (j.contains("logging"))
      cfg.eventLog = j.at("logging").value("event_log", std::string{});

    if (j.contains("queues")) {
      const auto& q = j.at("queues");
      cfg.plotCapacity = q.value("plot_capacity", cfg.plotCapacity);
      cfg.storageCapacity = q.value("storage_capacity", cfg.storageCapacity);
      if (cfg.plotCapacity == 0 || cfg.storageCapacity == 0)
        throw ValidationError("[SystemConfig] queue capacities must be > 0");
    }

    const double pause = j.value("pause_between_runs_s", 2.0);
    if (!(pause >= 0.0))
      throw ValidationError("[SystemConfig] pause_between_runs_s must be >= 0");
    cfg.pauseBetweenRuns =
        std::chrono::milliseconds{ static_cast<long long>(std::llround(pause * 1000.0)) };

    const auto& experiments = j.at("experiments");
    if (!experiments.is_array() || experiments.empty())
      throw ValidationError("[SystemConfig] experiments must be a non-empty array");
    for (std::size_t i = 0; i < experiments.size(); ++i)
      cfg.experiments.push_back(parseExperiment(experiments.at(i), i));

  } catch (const json::exception& e) {
    throw ValidationError(std::string("[SystemConfig] ") + e.what());
  }
  return cfg;
}
