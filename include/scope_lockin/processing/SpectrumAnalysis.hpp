/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <vector>

#include "scope_lockin/entities/LockInResult.hpp"

namespace scope_lockin {
// Frequency of the strongest strictly positive DFT bin of the waveform. The
// estimate is quantized to the bin spacing 1 / (N * timeIncrement), which is
// also its uncertainty. Throws ProcessingError when the waveform carries no
// energy above DC.
double extractFundamentalFrequency(const std::vector<float> &waveform,
                                   double timeIncrement);

// cos/sin at the given frequency with zero phase at sample 0.
ReferenceSignals generateReferenceSignals(double frequencyHz, std::size_t count,
                                          double timeIncrement);
}  // namespace scope_lockin
