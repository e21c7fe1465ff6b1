/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>

#include "scope_lockin/entities/AveragedEstimate.hpp"
#include "scope_lockin/entities/LockInResult.hpp"

namespace scope_lockin {
// Index of the first sample in the trailing window. A fraction of 0, or one
// too small to cover a whole sample, selects the last sample alone.
std::size_t averagingWindowStart(std::size_t sampleCount,
                                 double averagingFraction);

// Arithmetic mean of amplitude and unwrapped phase over the trailing
// averagingFraction of the result.
AveragedEstimate computeAveragedEstimate(const LockInResult &result,
                                         double averagingFraction,
                                         double timestamp);
}  // namespace scope_lockin
