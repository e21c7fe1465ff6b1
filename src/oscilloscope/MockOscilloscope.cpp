/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/oscilloscope/MockOscilloscope.hpp"

#include <cmath>

#include "loguru/loguru.hpp"
#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
namespace {
constexpr double kDefaultSampleRateHz = 100000.0;
constexpr double kTwoPi = 6.283185307179586476925286766559;
}  // namespace

MockOscilloscope::MockOscilloscope(MockSignal signal, LogContext log)
    : signal(signal), log(std::move(log)), generator(signal.seed) {
  if (this->log.name.empty()) {
    this->log.name = "mock";
  }
}

std::vector<ParameterSpec> MockOscilloscope::parameterSchema() const {
  return {
      {"memory_depth", ParameterType::INTEGER, {1000, 10000, 100000, 1000000},
       10000},
      {"sample_rate", ParameterType::REAL, {}, kDefaultSampleRateHz},
      {"channel_range", ParameterType::REAL, {}, 10},
      {"reference_channel", ParameterType::CHANNEL, {1, 2, 3, 4}, 1},
      {"acquisition_channel", ParameterType::CHANNEL, {1, 2, 3, 4}, 2},
  };
}

void MockOscilloscope::configure(const ScopeSettings &newSettings) {
  validateScopeSettings(newSettings, parameterSchema());
  if (closed) {
    throw TransportError(log.name + ": instrument is closed");
  }
  settings = newSettings;
  if (settings.sampleRateHz == 0.0) {
    settings.sampleRateHz = kDefaultSampleRateHz;
  }
  configured = true;
  LOG_S(INFO) << log.name << ": " << settings.memoryDepth << " points at "
              << settings.sampleRateHz << " Hz";
}

AcquisitionData MockOscilloscope::acquire() {
  if (closed) {
    throw TransportError(log.name + ": instrument is closed");
  }
  if (!configured) {
    throw ConfigurationError(log.name + ": acquire() before configure()");
  }

  const auto samples = settings.memoryDepth;
  const double timeIncrement = 1.0 / settings.sampleRateHz;
  std::normal_distribution<double> noise(
      0.0, signal.noiseStdDev > 0.0 ? signal.noiseStdDev : 1.0);

  AcquisitionData data;
  data.timeIncrement = timeIncrement;
  data.timeOrigin = 0.0;
  data.refWaveform.resize(samples);
  data.acquisitionWaveform.resize(samples);
  for (std::size_t i = 0; i < samples; ++i) {
    const double angle = kTwoPi * signal.frequencyHz * i * timeIncrement;
    data.refWaveform[i] =
        static_cast<float>(signal.referenceAmplitude * std::sin(angle));
    double value = signal.signalAmplitude * std::sin(angle + signal.phaseRadians);
    if (signal.noiseStdDev > 0.0) {
      value += noise(generator);
    }
    data.acquisitionWaveform[i] = static_cast<float>(value);
  }

  ++acquireCount;
  VLOG_S(log.traceVerbosity) << log.name << ": capture " << acquireCount;
  return data;
}

void MockOscilloscope::close() {
  closed = true;
  configured = false;
}

std::string MockOscilloscope::identity() {
  return "MockOscilloscope " + std::to_string(signal.frequencyHz) + " Hz";
}
}  // namespace scope_lockin
