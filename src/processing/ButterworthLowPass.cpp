/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/processing/ButterworthLowPass.hpp"

#include <cmath>
#include <sstream>

#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
ButterworthLowPass::ButterworthLowPass(int order, double cutoffHz,
                                       double sampleRateHz)
    : order(order), normalizedCutoff(0.0) {
  if (order < kMinFilterOrder || order > kMaxFilterOrder) {
    throw ConfigurationError("Filter order must be between " +
                             std::to_string(kMinFilterOrder) + " and " +
                             std::to_string(kMaxFilterOrder) + ", got " +
                             std::to_string(order));
  }
  if (!(sampleRateHz > 0.0) || !std::isfinite(sampleRateHz)) {
    throw ProcessingError("Sample rate must be positive and finite");
  }
  const double nyquist = 0.5 * sampleRateHz;
  if (!(cutoffHz > 0.0) || !(cutoffHz < nyquist)) {
    std::ostringstream message;
    message << "Low-pass cutoff " << cutoffHz
            << " Hz must lie strictly between 0 and the Nyquist frequency "
            << nyquist << " Hz";
    throw ConfigurationError(message.str());
  }

  normalizedCutoff = cutoffHz / nyquist;
  filter.setup(order, sampleRateHz, cutoffHz);
}

std::vector<double> ButterworthLowPass::apply(const std::vector<double> &input) {
  filter.reset();
  std::vector<double> output;
  output.reserve(input.size());
  for (const double sample : input) {
    output.push_back(filter.filter(sample));
  }
  return output;
}
}  // namespace scope_lockin
