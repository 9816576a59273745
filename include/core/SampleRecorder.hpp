#pragma once
/** @file  SampleRecorder.hpp
 *  @brief Storage end of the pipeline: one CSV row per Sample.
 *
 *  © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <cstdint>
#include <string>

#include "core/Sample.hpp"
#include "io/FileLogger.hpp"

namespace anod {
  namespace core {

    /**
 * @class SampleRecorder
 * @brief Writes the header once at open, then rows in a fixed column order:
 *        timestamp_s, stage, target, measured_voltage, measured_current, power,
 *        control_signal, mode, kp, ki, kd, kff.
 */
    class SampleRecorder {
    public:
      /** @returns false if the file can't be created. */
      bool open(const std::string& path);

      /// Throws std::runtime_error when not open or the write fails.
      void record(const Sample& sample);

      bool flush() { return file_.flush(); }
      void close() { file_.close(); }

      bool isOpen() const { return file_.isOpen(); }
      std::uint64_t rows() const { return rows_; }

      static std::string header();
      static std::string toCsv(const Sample& sample);

    private:
      io::FileLogger file_;
      std::uint64_t rows_{ 0 };
    };

  } // namespace core
} // namespace anod
