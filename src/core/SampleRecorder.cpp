/* @file SampleRecorder.cpp
 * @brief Sample → CSV row
 *
 * © 2025 ANOD Middleware authors — MIT-licensed.
 */

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "core/SampleRecorder.hpp"

using namespace anod::core;

bool SampleRecorder::open(const std::string& path) {
  rows_ = 0;
  if (!file_.open(path))
    return false;
  if (!file_.write(header())) {
    file_.close();
    return false;
  }
  return true;
}

void SampleRecorder::record(const Sample& sample) {
  if (!file_.write(toCsv(sample)))
    throw std::runtime_error("[SampleRecorder] write failed: " + file_.path());
  ++rows_;
}

std::string SampleRecorder::header() {
  return "timestamp_s,stage,target,measured_voltage,measured_current,power,control_signal,mode,"
         "kp,ki,kd,kff\n";
}

std::string SampleRecorder::toCsv(const Sample& s) {
  std::ostringstream os;
  os << std::setprecision(10) << s.timestamp << ',' << s.stageIndex << ',' << s.target << ','
     << s.measured << ',' << s.measuredCurrent << ',' << s.measured * s.measuredCurrent << ','
     << s.controlSignal << ',' << control::toString(s.strategy.mode) << ',' << s.strategy.kp
     << ',' << s.strategy.ki << ',' << s.strategy.kd << ',' << s.strategy.kff << '\n';
  return os.str();
}
