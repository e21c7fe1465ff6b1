/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <algorithm>
#include <cmath>

#include <gtest/gtest.h>

#include "SyntheticSignals.hpp"
#include "scope_lockin/Errors.hpp"
#include "scope_lockin/oscilloscope/MockOscilloscope.hpp"
#include "scope_lockin/processing/Averager.hpp"
#include "scope_lockin/processing/ButterworthLowPass.hpp"
#include "scope_lockin/processing/LockInProcessor.hpp"
#include "scope_lockin/processing/SpectrumAnalysis.hpp"

using namespace scope_lockin;
using scope_lockin::test::degrees;
using scope_lockin::test::makeTone;
using scope_lockin::test::radians;

namespace {
LockInSettings settings100Hz() {
  LockInSettings settings;
  settings.lowPassCutoffHz = 100.0;
  settings.filterOrder = 4;
  settings.averagingFraction = 0.5;
  return settings;
}
}  // namespace

TEST(LockInProcessor, RecoversAmplitudeAndPhaseOfSyntheticTone) {
  const auto data = makeTone(1000.0, 100000.0, 10000, 5.0, radians(30.0));
  const auto settings = settings100Hz();

  const auto result = performLockIn(data, settings);
  ASSERT_EQ(result.time.size(), 10000u);
  ASSERT_EQ(result.amplitude.size(), 10000u);
  ASSERT_EQ(result.phaseRadians.size(), 10000u);
  EXPECT_NEAR(result.fundamentalFreqHz, 1000.0, 10.0);

  const auto estimate =
      computeAveragedEstimate(result, settings.averagingFraction, 0.0);
  EXPECT_NEAR(estimate.amplitude, 5.0, 0.1);
  // Leading the reference by 30 degrees reads as -30 degrees.
  EXPECT_NEAR(degrees(estimate.phaseRadians), -30.0, 2.0);
}

TEST(LockInProcessor, InPhaseSignalHasZeroPhase) {
  const auto data = makeTone(2000.0, 100000.0, 10000, 1.0, 0.0);
  const auto result = performLockIn(data, settings100Hz());
  const auto estimate = computeAveragedEstimate(result, 0.5, 0.0);
  EXPECT_NEAR(estimate.amplitude, 1.0, 0.02);
  EXPECT_NEAR(degrees(estimate.phaseRadians), 0.0, 1.0);
}

TEST(LockInProcessor, TimeAxisStartsAtOrigin) {
  auto data = makeTone(1000.0, 100000.0, 1000, 1.0, 0.0);
  data.timeOrigin = -0.005;

  const auto result = performLockIn(data, settings100Hz());
  EXPECT_DOUBLE_EQ(result.time.front(), -0.005);
  EXPECT_DOUBLE_EQ(result.time[10], -0.005 + 10 * data.timeIncrement);
  EXPECT_DOUBLE_EQ(result.time.back(), -0.005 + 999 * data.timeIncrement);
}

TEST(LockInProcessor, RepeatedRunsAreIdentical) {
  const auto data = makeTone(1000.0, 100000.0, 5000, 2.0, radians(45.0));
  const auto first = performLockIn(data, settings100Hz());
  const auto second = performLockIn(data, settings100Hz());
  EXPECT_EQ(first.amplitude, second.amplitude);
  EXPECT_EQ(first.phaseRadians, second.phaseRadians);
  EXPECT_EQ(first.fundamentalFreqHz, second.fundamentalFreqHz);
}

TEST(LockInProcessor, FrequencyBetweenBinsIsWithinOneBin) {
  // Bin spacing is 10 Hz here.
  const auto data = makeTone(1234.0, 100000.0, 10000, 1.0, 0.0);
  const auto result = performLockIn(data, settings100Hz());
  EXPECT_NEAR(result.fundamentalFreqHz, 1234.0, 10.0);

  const auto estimate = computeAveragedEstimate(result, 0.5, 0.0);
  EXPECT_NEAR(estimate.amplitude, 1.0, 0.03);
}

TEST(LockInProcessor, ReferencesStartAtZeroPhase) {
  const auto data = makeTone(1000.0, 100000.0, 2000, 1.0, 0.0);
  ReferenceSignals references;
  performLockIn(data, settings100Hz(), references);

  ASSERT_EQ(references.cosine.size(), 2000u);
  ASSERT_EQ(references.sine.size(), 2000u);
  EXPECT_DOUBLE_EQ(references.cosine[0], 1.0);
  EXPECT_DOUBLE_EQ(references.sine[0], 0.0);
  // A quarter period at 1 kHz and 100 kHz is 25 samples.
  EXPECT_NEAR(references.sine[25], 1.0, 1e-9);
}

TEST(LockInProcessor, SilentReferenceIsProcessingError) {
  auto data = makeTone(1000.0, 100000.0, 1000, 1.0, 0.0);
  std::fill(data.refWaveform.begin(), data.refWaveform.end(), 0.0f);
  EXPECT_THROW(performLockIn(data, settings100Hz()), ProcessingError);

  std::fill(data.refWaveform.begin(), data.refWaveform.end(), 1.0f);
  EXPECT_THROW(performLockIn(data, settings100Hz()), ProcessingError);
}

TEST(LockInProcessor, InvalidFilterSettingsAreConfigurationErrors) {
  const auto data = makeTone(1000.0, 100000.0, 1000, 1.0, 0.0);

  auto settings = settings100Hz();
  settings.lowPassCutoffHz = 0.0;
  EXPECT_THROW(performLockIn(data, settings), ConfigurationError);

  settings = settings100Hz();
  settings.lowPassCutoffHz = 50000.0;  // Nyquist
  EXPECT_THROW(performLockIn(data, settings), ConfigurationError);

  settings = settings100Hz();
  settings.filterOrder = 0;
  EXPECT_THROW(performLockIn(data, settings), ConfigurationError);

  settings.filterOrder = 11;
  EXPECT_THROW(performLockIn(data, settings), ConfigurationError);

  settings = settings100Hz();
  settings.averagingFraction = 1.5;
  EXPECT_THROW(validateLockInSettings(settings), ConfigurationError);
}

TEST(LockInProcessor, MalformedDataIsProcessingError) {
  auto data = makeTone(1000.0, 100000.0, 1000, 1.0, 0.0);
  data.acquisitionWaveform.pop_back();
  EXPECT_THROW(performLockIn(data, settings100Hz()), ProcessingError);

  EXPECT_THROW(performLockIn(AcquisitionData{}, settings100Hz()),
               ProcessingError);

  data = makeTone(1000.0, 100000.0, 1000, 1.0, 0.0);
  data.timeIncrement = 0.0;
  EXPECT_THROW(performLockIn(data, settings100Hz()), ProcessingError);

  data = makeTone(1000.0, 100000.0, 1000, 1.0, 0.0);
  data.acquisitionWaveform[17] = std::nanf("");
  EXPECT_THROW(performLockIn(data, settings100Hz()), ProcessingError);
}

TEST(LockInProcessor, UnwrapRemovesTwoPiJumps) {
  std::vector<double> phase = {0.0, 3.0, -3.0, 0.0};
  unwrapPhase(phase);
  EXPECT_DOUBLE_EQ(phase[0], 0.0);
  EXPECT_DOUBLE_EQ(phase[1], 3.0);
  EXPECT_NEAR(phase[2], -3.0 + 2.0 * test::kPi, 1e-12);
  EXPECT_NEAR(phase[3], 2.0 * test::kPi, 1e-12);

  std::vector<double> smooth = {0.0, 0.5, 1.0, 0.2};
  const auto copy = smooth;
  unwrapPhase(smooth);
  EXPECT_EQ(smooth, copy);
}

TEST(LockInProcessor, NoisyMockCapture) {
  MockSignal signal;
  signal.frequencyHz = 1000.0;
  signal.signalAmplitude = 1.0;
  signal.phaseRadians = radians(60.0);
  signal.noiseStdDev = 0.5;
  MockOscilloscope scope(signal);

  ScopeSettings scopeSettings;
  scopeSettings.memoryDepth = 100000;
  scopeSettings.sampleRateHz = 100000.0;
  scope.configure(scopeSettings);

  LockInSettings settings;
  settings.lowPassCutoffHz = 10.0;
  const auto result = performLockIn(scope.acquire(), settings);
  const auto estimate = computeAveragedEstimate(result, 0.5, 0.0);
  EXPECT_NEAR(estimate.amplitude, 1.0, 0.05);
  EXPECT_NEAR(degrees(estimate.phaseRadians), -60.0, 3.0);
}

TEST(SpectrumAnalysis, NeedsThreeSamples) {
  EXPECT_THROW(extractFundamentalFrequency({1.0f, -1.0f}, 1e-3),
               ProcessingError);
}

TEST(SpectrumAnalysis, FindsStrongestPositiveBin) {
  const auto data = makeTone(250.0, 1000.0, 100, 1.0, 0.0);
  EXPECT_NEAR(extractFundamentalFrequency(data.refWaveform, 1e-3), 250.0, 1e-9);
}

TEST(ButterworthLowPass, PassesDcAndRestartsPerSequence) {
  ButterworthLowPass filter(4, 10.0, 1000.0);
  EXPECT_EQ(filter.getOrder(), 4);
  EXPECT_DOUBLE_EQ(filter.getNormalizedCutoff(), 0.02);

  const std::vector<double> step(2000, 1.0);
  const auto first = filter.apply(step);
  const auto second = filter.apply(step);
  EXPECT_NEAR(first.back(), 1.0, 1e-6);
  EXPECT_LT(first.front(), 0.01);
  EXPECT_EQ(first, second);
}
