/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/processing/SpectrumAnalysis.hpp"

#include <cmath>
#include <complex>

#include <unsupported/Eigen/FFT>

#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
namespace {
constexpr double kTwoPi = 6.283185307179586476925286766559;

// A peak this small relative to the summed absolute sample values is rounding
// noise, not a tone.
constexpr double kDegeneratePeakRatio = 1e-9;
}  // namespace

double extractFundamentalFrequency(const std::vector<float> &waveform,
                                   double timeIncrement) {
  if (!(timeIncrement > 0.0) || !std::isfinite(timeIncrement)) {
    throw ProcessingError("Time increment must be positive and finite");
  }
  const std::size_t count = waveform.size();
  // Strictly positive bins are 1 .. (N - 1) / 2; the N / 2 bin of an even
  // length transform is the Nyquist bin and counts as negative.
  const std::size_t lastPositiveBin = count > 0 ? (count - 1) / 2 : 0;
  if (lastPositiveBin < 1) {
    throw ProcessingError("Need at least 3 reference samples, got " +
                          std::to_string(count));
  }

  std::vector<double> samples(waveform.begin(), waveform.end());
  double scale = 0.0;
  for (const double sample : samples) {
    if (!std::isfinite(sample)) {
      throw ProcessingError("Reference waveform contains non-finite samples");
    }
    scale += std::abs(sample);
  }

  Eigen::FFT<double> fft;
  fft.SetFlag(Eigen::FFT<double>::HalfSpectrum);
  std::vector<std::complex<double>> spectrum;
  fft.fwd(spectrum, samples);

  std::size_t peakBin = 0;
  double peakMagnitude = 0.0;
  for (std::size_t bin = 1; bin <= lastPositiveBin; ++bin) {
    const double magnitude = std::abs(spectrum[bin]);
    if (magnitude > peakMagnitude) {
      peakMagnitude = magnitude;
      peakBin = bin;
    }
  }

  if (peakBin == 0 || scale == 0.0 ||
      peakMagnitude <= kDegeneratePeakRatio * scale) {
    throw ProcessingError(
        "Reference waveform has no energy above DC, fundamental frequency is undefined");
  }

  return static_cast<double>(peakBin) /
         (static_cast<double>(count) * timeIncrement);
}

ReferenceSignals generateReferenceSignals(double frequencyHz, std::size_t count,
                                          double timeIncrement) {
  ReferenceSignals references;
  references.cosine.resize(count);
  references.sine.resize(count);
  for (std::size_t i = 0; i < count; ++i) {
    const double angle =
        kTwoPi * frequencyHz * static_cast<double>(i) * timeIncrement;
    references.cosine[i] = std::cos(angle);
    references.sine[i] = std::sin(angle);
  }
  return references;
}
}  // namespace scope_lockin
