/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "scope_lockin/oscilloscope/AcquisitionProtocol.hpp"
#include "scope_lockin/oscilloscope/OscilloscopeInterface.hpp"

namespace scope_lockin {
// SCPI single-sweep scope of the DS1000Z family.
class SweepOscilloscope : public OscilloscopeInterface {
 public:
  SweepOscilloscope(std::unique_ptr<ScpiTransport> transport, LogContext log,
                    AcquisitionTiming timing = {});

  void configure(const ScopeSettings &settings) override;
  AcquisitionData acquire() override;
  void close() override;
  std::vector<ParameterSpec> parameterSchema() const override;
  std::string identity() override;

 private:
  AcquisitionProtocol protocol;
  LogContext log;
  ScopeSettings settings;
  bool configured = false;
  std::string idn;
};
}  // namespace scope_lockin
