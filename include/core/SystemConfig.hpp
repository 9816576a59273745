#pragma once
/** @file  SystemConfig.hpp
 *  @brief Typed view of the JSON configuration (serial link, device, experiments).
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "core/ExperimentController.hpp"
#include "core/RegisterClient.hpp"
#include "core/StageSequencer.hpp"

namespace anod {
  namespace core {

    struct SerialConfig {
      std::string device{ "/dev/ttyUSB0" };
      int baud{ 9600 };
      ClientOptions client{};
    };

    struct DeviceConfig {
      bool probeScaling{ true }; ///< read the decimal-point register at startup
      std::optional<std::pair<double, double>> voltageRange; ///< safe setpoint range override
      std::optional<std::pair<double, double>> currentRange;
      std::optional<double> overVoltage; ///< OVP limit written at startup
      std::optional<double> overCurrent; ///< OCP limit written at startup
      std::optional<double> currentLimit; ///< current setpoint written at startup
      bool enableOutput{ true };
    };

    struct ExperimentPlan {
      std::string name;
      ExperimentConfig config;
      std::vector<Stage> stages;
      std::string output; ///< CSV path for the storage consumer, empty = don't record
    };

    struct SystemConfig {
      SerialConfig serial;
      DeviceConfig device;
      std::string eventLog{}; ///< empty = no event log file
      std::size_t plotCapacity{ 256 };
      std::size_t storageCapacity{ 4096 };
      std::chrono::milliseconds pauseBetweenRuns{ 2000 };
      std::vector<ExperimentPlan> experiments;

      /// Throws ValidationError naming the offending key.
      static SystemConfig fromJson(const nlohmann::json& j);
    };

  } // namespace core
} // namespace anod
