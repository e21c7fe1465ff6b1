/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/oscilloscope/SweepOscilloscope.hpp"

#include "loguru/loguru.hpp"
#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
SweepOscilloscope::SweepOscilloscope(std::unique_ptr<ScpiTransport> transport,
                                     LogContext log, AcquisitionTiming timing)
    : protocol(std::move(transport), log.child("protocol"), timing),
      log(std::move(log)) {}

std::vector<ParameterSpec> SweepOscilloscope::parameterSchema() const {
  return {
      {"memory_depth", ParameterType::INTEGER,
       {6000, 60000, 600000, 6000000, 12000000}, 12000000},
      {"sample_rate", ParameterType::REAL, {}, 0},
      {"channel_range", ParameterType::REAL, {}, 8},
      {"reference_channel", ParameterType::CHANNEL, {1, 2, 3, 4}, 1},
      {"acquisition_channel", ParameterType::CHANNEL, {1, 2, 3, 4}, 2},
  };
}

void SweepOscilloscope::configure(const ScopeSettings &newSettings) {
  validateScopeSettings(newSettings, parameterSchema());

  configured = false;
  protocol.setupCapture(newSettings.memoryDepth, newSettings.sampleRateHz,
                        newSettings.channelRangesVolts,
                        newSettings.referenceChannel,
                        newSettings.acquisitionChannel);
  settings = newSettings;
  configured = true;
}

AcquisitionData SweepOscilloscope::acquire() {
  if (!configured) {
    throw ConfigurationError(log.name + ": acquire() before configure()");
  }
  return protocol.acquire(settings.referenceChannel,
                          settings.acquisitionChannel);
}

void SweepOscilloscope::close() {
  protocol.close();
  configured = false;
}

std::string SweepOscilloscope::identity() {
  if (idn.empty()) {
    idn = protocol.identify();
    LOG_S(INFO) << log.name << ": connected to " << idn;
  }
  return idn;
}
}  // namespace scope_lockin
