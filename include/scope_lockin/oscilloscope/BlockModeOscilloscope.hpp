/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "scope_lockin/LogContext.hpp"
#include "scope_lockin/oscilloscope/BlockCaptureDriver.hpp"
#include "scope_lockin/oscilloscope/OscilloscopeInterface.hpp"

namespace scope_lockin {
class BlockModeOscilloscope : public OscilloscopeInterface {
 public:
  BlockModeOscilloscope(std::unique_ptr<BlockCaptureDriver> driver,
                        LogContext log,
                        std::chrono::milliseconds pollInterval =
                            std::chrono::milliseconds(100),
                        std::chrono::milliseconds timeoutMargin =
                            std::chrono::milliseconds(5000));
  ~BlockModeOscilloscope() override;

  void configure(const ScopeSettings &settings) override;
  AcquisitionData acquire() override;
  void close() override;
  std::vector<ParameterSpec> parameterSchema() const override;
  std::string identity() override;

  // Ready-poll limit for the configured capture: three times the capture
  // duration plus the timeout margin (5 s by default).
  std::chrono::milliseconds captureTimeout() const;

  double getSampleInterval() const { return sampleInterval; }

 private:
  BlockCaptureDriver &requireDriver();

  std::unique_ptr<BlockCaptureDriver> driver;
  LogContext log;
  std::chrono::milliseconds pollInterval;
  std::chrono::milliseconds timeoutMargin;
  ScopeSettings settings;
  bool configured = false;
  double sampleInterval = 0.0;
};
}  // namespace scope_lockin
