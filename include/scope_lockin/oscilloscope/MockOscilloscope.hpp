/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include "scope_lockin/LogContext.hpp"
#include "scope_lockin/oscilloscope/OscilloscopeInterface.hpp"

namespace scope_lockin {
struct MockSignal {
  double frequencyHz = 1000.0;
  double referenceAmplitude = 1.0;
  double signalAmplitude = 1.0;
  double phaseRadians = 0.0;   // signal relative to the reference
  double noiseStdDev = 0.0;    // volts, added to the signal channel
  uint32_t seed = 42;
};

// In-memory scope producing a sine reference and a phase-shifted copy on the
// acquisition channel. Deterministic for a given seed.
class MockOscilloscope : public OscilloscopeInterface {
 public:
  explicit MockOscilloscope(MockSignal signal = {}, LogContext log = {});

  void configure(const ScopeSettings &settings) override;
  AcquisitionData acquire() override;
  void close() override;
  std::vector<ParameterSpec> parameterSchema() const override;
  std::string identity() override;

  int getAcquireCount() const { return acquireCount; }
  bool isClosed() const { return closed; }

 private:
  MockSignal signal;
  LogContext log;
  ScopeSettings settings;
  bool configured = false;
  bool closed = false;
  int acquireCount = 0;
  std::mt19937 generator;
};
}  // namespace scope_lockin
