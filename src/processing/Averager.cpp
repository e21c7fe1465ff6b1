/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/processing/Averager.hpp"

#include <cmath>
#include <sstream>

#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
std::size_t averagingWindowStart(std::size_t sampleCount,
                                 double averagingFraction) {
  if (!(averagingFraction >= 0.0 && averagingFraction <= 1.0)) {
    std::ostringstream message;
    message << "Averaging fraction must be within [0, 1], got "
            << averagingFraction;
    throw ConfigurationError(message.str());
  }
  if (sampleCount == 0) {
    return 0;
  }
  const auto start = static_cast<std::size_t>(
      std::floor(static_cast<double>(sampleCount) * (1.0 - averagingFraction)));
  return start >= sampleCount ? sampleCount - 1 : start;
}

AveragedEstimate computeAveragedEstimate(const LockInResult &result,
                                         double averagingFraction,
                                         double timestamp) {
  const std::size_t count = result.amplitude.size();
  const std::size_t start = averagingWindowStart(count, averagingFraction);
  if (count == 0) {
    throw ProcessingError("Cannot average an empty lock-in result");
  }
  if (result.phaseRadians.size() != count) {
    throw ProcessingError("Amplitude and phase sequences differ in length");
  }

  double amplitudeSum = 0.0;
  double phaseSum = 0.0;
  for (std::size_t i = start; i < count; ++i) {
    amplitudeSum += result.amplitude[i];
    phaseSum += result.phaseRadians[i];
  }
  const double window = static_cast<double>(count - start);

  AveragedEstimate estimate;
  estimate.amplitude = amplitudeSum / window;
  estimate.phaseRadians = phaseSum / window;
  estimate.timestamp = timestamp;
  return estimate;
}
}  // namespace scope_lockin
