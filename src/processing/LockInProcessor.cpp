/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/processing/LockInProcessor.hpp"

#include <cmath>
#include <sstream>

#include "scope_lockin/Errors.hpp"
#include "scope_lockin/processing/ButterworthLowPass.hpp"
#include "scope_lockin/processing/SpectrumAnalysis.hpp"

namespace scope_lockin {
namespace {
constexpr double kPi = 3.14159265358979323846264338327950288;
constexpr double kTwoPi = 2.0 * kPi;

void validateData(const AcquisitionData &data) {
  if (data.refWaveform.empty()) {
    throw ProcessingError("Acquisition holds no samples");
  }
  if (data.refWaveform.size() != data.acquisitionWaveform.size()) {
    throw ProcessingError("Reference and acquisition waveforms differ in length: " +
                          std::to_string(data.refWaveform.size()) + " vs " +
                          std::to_string(data.acquisitionWaveform.size()));
  }
  if (!(data.timeIncrement > 0.0) || !std::isfinite(data.timeIncrement)) {
    throw ProcessingError("Time increment must be positive and finite");
  }
  for (const float sample : data.acquisitionWaveform) {
    if (!std::isfinite(sample)) {
      throw ProcessingError("Acquisition waveform contains non-finite samples");
    }
  }
}
}  // namespace

void validateLockInSettings(const LockInSettings &settings) {
  if (!(settings.lowPassCutoffHz > 0.0) ||
      !std::isfinite(settings.lowPassCutoffHz)) {
    std::ostringstream message;
    message << "Low-pass cutoff must be positive, got "
            << settings.lowPassCutoffHz << " Hz";
    throw ConfigurationError(message.str());
  }
  if (settings.filterOrder < kMinFilterOrder ||
      settings.filterOrder > kMaxFilterOrder) {
    throw ConfigurationError("Filter order must be between " +
                             std::to_string(kMinFilterOrder) + " and " +
                             std::to_string(kMaxFilterOrder) + ", got " +
                             std::to_string(settings.filterOrder));
  }
  if (!(settings.averagingFraction >= 0.0 && settings.averagingFraction <= 1.0)) {
    std::ostringstream message;
    message << "Averaging fraction must be within [0, 1], got "
            << settings.averagingFraction;
    throw ConfigurationError(message.str());
  }
}

std::vector<double> buildTimeAxis(const AcquisitionData &data) {
  std::vector<double> time(data.refWaveform.size());
  for (std::size_t i = 0; i < time.size(); ++i) {
    time[i] = data.timeOrigin + static_cast<double>(i) * data.timeIncrement;
  }
  return time;
}

void unwrapPhase(std::vector<double> &phase) {
  double correction = 0.0;
  for (std::size_t i = 1; i < phase.size(); ++i) {
    // phase[i - 1] already carries the correction accumulated so far.
    const double step = phase[i] + correction - phase[i - 1];
    if (std::abs(step) < kPi) {
      phase[i] += correction;
      continue;
    }
    double wrapped = std::fmod(step + kPi, kTwoPi);
    if (wrapped < 0.0) {
      wrapped += kTwoPi;
    }
    wrapped -= kPi;
    if (wrapped == -kPi && step > 0.0) {
      wrapped = kPi;
    }
    correction += wrapped - step;
    phase[i] += correction;
  }
}

LockInResult performLockIn(const AcquisitionData &data,
                           const LockInSettings &settings) {
  ReferenceSignals references;
  return performLockIn(data, settings, references);
}

LockInResult performLockIn(const AcquisitionData &data,
                           const LockInSettings &settings,
                           ReferenceSignals &references) {
  validateLockInSettings(settings);
  validateData(data);

  const std::size_t count = data.refWaveform.size();
  const double sampleRate = 1.0 / data.timeIncrement;

  // Checks the cutoff against Nyquist before any computation.
  ButterworthLowPass inPhaseFilter(settings.filterOrder,
                                   settings.lowPassCutoffHz, sampleRate);
  ButterworthLowPass quadratureFilter(settings.filterOrder,
                                      settings.lowPassCutoffHz, sampleRate);

  LockInResult result;
  result.fundamentalFreqHz =
      extractFundamentalFrequency(data.refWaveform, data.timeIncrement);
  result.time = buildTimeAxis(data);

  references =
      generateReferenceSignals(result.fundamentalFreqHz, count, data.timeIncrement);

  std::vector<double> inPhase(count);
  std::vector<double> quadrature(count);
  double refCosSum = 0.0;
  double refSinSum = 0.0;
  for (std::size_t i = 0; i < count; ++i) {
    const double acquired = data.acquisitionWaveform[i];
    inPhase[i] = acquired * references.cosine[i];
    quadrature[i] = acquired * references.sine[i];
    refCosSum += data.refWaveform[i] * references.cosine[i];
    refSinSum += data.refWaveform[i] * references.sine[i];
  }

  const auto inPhaseFiltered = inPhaseFilter.apply(inPhase);
  const auto quadratureFiltered = quadratureFilter.apply(quadrature);

  // The references start at zero phase; the physical reference does not.
  const double n = static_cast<double>(count);
  const double referencePhase = std::atan2(refSinSum / n, refCosSum / n);

  result.amplitude.resize(count);
  result.phaseRadians.resize(count);
  for (std::size_t i = 0; i < count; ++i) {
    const double x = inPhaseFiltered[i];
    const double y = quadratureFiltered[i];
    // Demodulation halves the amplitude.
    result.amplitude[i] = 2.0 * std::sqrt(x * x + y * y);
    result.phaseRadians[i] = std::atan2(y, x) - referencePhase;
  }
  unwrapPhase(result.phaseRadians);

  return result;
}
}  // namespace scope_lockin
