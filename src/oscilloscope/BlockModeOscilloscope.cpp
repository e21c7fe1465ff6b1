/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/oscilloscope/BlockModeOscilloscope.hpp"

#include <cmath>

#include "loguru/loguru.hpp"
#include "scope_lockin/Errors.hpp"
#include "scope_lockin/oscilloscope/Polling.hpp"

namespace scope_lockin {
namespace {
constexpr double kDefaultSampleRateHz = 1e6;
constexpr double kDefaultRangeVolts = 10.0;
}  // namespace

BlockModeOscilloscope::BlockModeOscilloscope(
    std::unique_ptr<BlockCaptureDriver> driver, LogContext log,
    std::chrono::milliseconds pollInterval,
    std::chrono::milliseconds timeoutMargin)
    : driver(std::move(driver)),
      log(std::move(log)),
      pollInterval(pollInterval),
      timeoutMargin(timeoutMargin) {
  if (!this->driver) {
    throw ConfigurationError(this->log.name + ": no capture driver given");
  }
  for (const auto channel : allChannels) {
    this->driver->setChannelOff(channel);
  }
}

BlockModeOscilloscope::~BlockModeOscilloscope() {
  try {
    close();
  } catch (const std::exception &e) {
    LOG_S(ERROR) << log.name << ": closing the unit failed: " << e.what();
  }
}

std::vector<ParameterSpec> BlockModeOscilloscope::parameterSchema() const {
  return {
      {"memory_depth", ParameterType::INTEGER,
       {10000, 100000, 1000000, 10000000}, 1000000},
      {"sample_rate", ParameterType::REAL, {}, kDefaultSampleRateHz},
      {"channel_range", ParameterType::REAL,
       {0.01, 0.02, 0.05, 0.1, 0.2, 0.5, 1, 2, 5, 10, 20}, kDefaultRangeVolts},
      {"reference_channel", ParameterType::CHANNEL, {1, 2, 3, 4}, 1},
      {"acquisition_channel", ParameterType::CHANNEL, {1, 2, 3, 4}, 3},
  };
}

BlockCaptureDriver &BlockModeOscilloscope::requireDriver() {
  if (!driver) {
    throw TransportError(log.name + ": unit is closed");
  }
  return *driver;
}

void BlockModeOscilloscope::configure(const ScopeSettings &newSettings) {
  validateScopeSettings(newSettings, parameterSchema());

  auto &unit = requireDriver();
  configured = false;

  auto rangeOf = [&newSettings](Channel channel) {
    const auto it = newSettings.channelRangesVolts.find(channel);
    return it == newSettings.channelRangesVolts.end() ? kDefaultRangeVolts
                                                      : it->second;
  };

  for (const auto channel : allChannels) {
    unit.setChannelOff(channel);
  }
  unit.setChannelOn(newSettings.referenceChannel,
                    rangeOf(newSettings.referenceChannel));
  unit.setChannelOn(newSettings.acquisitionChannel,
                    rangeOf(newSettings.acquisitionChannel));
  unit.disableTrigger();

  const double requestedRate = newSettings.sampleRateHz > 0.0
                                   ? newSettings.sampleRateHz
                                   : kDefaultSampleRateHz;
  const double interval = unit.nearestSampleInterval(
      {newSettings.referenceChannel, newSettings.acquisitionChannel},
      1.0 / requestedRate);
  if (!(interval > 0.0) || !std::isfinite(interval)) {
    throw TransportError(log.name + ": driver returned an invalid sample interval");
  }

  LOG_S(INFO) << log.name << ": actual sample rate " << 1.0 / interval << " Hz";

  sampleInterval = interval;
  settings = newSettings;
  settings.channelRangesVolts[settings.referenceChannel] =
      rangeOf(settings.referenceChannel);
  settings.channelRangesVolts[settings.acquisitionChannel] =
      rangeOf(settings.acquisitionChannel);
  configured = true;
}

std::chrono::milliseconds BlockModeOscilloscope::captureTimeout() const {
  const double captureSeconds =
      sampleInterval * static_cast<double>(settings.memoryDepth) * 3.0;
  return std::chrono::milliseconds(
             static_cast<long long>(std::ceil(captureSeconds * 1000.0))) +
         timeoutMargin;
}

AcquisitionData BlockModeOscilloscope::acquire() {
  if (!configured) {
    throw ConfigurationError(log.name + ": acquire() before configure()");
  }
  auto &unit = requireDriver();
  const auto samples = settings.memoryDepth;
  const auto started = std::chrono::steady_clock::now();

  unit.runBlock(samples);
  pollUntil([&unit]() { return unit.isReady(); }, pollInterval,
            captureTimeout(), log.name + " block capture");

  const auto refCodes = unit.getValues(settings.referenceChannel, samples);
  const auto acqCodes = unit.getValues(settings.acquisitionChannel, samples);
  if (refCodes.size() != samples || acqCodes.size() != samples) {
    throw TransportError(log.name + ": driver returned " +
                         std::to_string(refCodes.size()) + "/" +
                         std::to_string(acqCodes.size()) + " samples, expected " +
                         std::to_string(samples));
  }

  const double maxCode = unit.maxAdcValue();
  if (!(maxCode > 0.0)) {
    throw TransportError(log.name + ": driver reports a non-positive full-scale code");
  }

  auto toVolts = [maxCode](const std::vector<int16_t> &codes, double range) {
    std::vector<float> volts;
    volts.reserve(codes.size());
    for (const auto code : codes) {
      volts.push_back(static_cast<float>(code / maxCode * range));
    }
    return volts;
  };

  AcquisitionData data;
  data.refWaveform = toVolts(
      refCodes, settings.channelRangesVolts.at(settings.referenceChannel));
  data.acquisitionWaveform = toVolts(
      acqCodes, settings.channelRangesVolts.at(settings.acquisitionChannel));
  data.timeIncrement = sampleInterval;
  data.timeOrigin = 0.0;

  VLOG_S(log.traceVerbosity)
      << log.name << ": buffers acquired in "
      << std::chrono::duration<double>(std::chrono::steady_clock::now() - started)
             .count()
      << " s";
  return data;
}

void BlockModeOscilloscope::close() {
  if (!driver) {
    return;
  }
  auto closing = std::move(driver);
  configured = false;
  closing->close();
  LOG_S(INFO) << log.name << ": unit closed";
}

std::string BlockModeOscilloscope::identity() {
  return requireDriver().describeUnit();
}
}  // namespace scope_lockin
