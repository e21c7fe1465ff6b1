/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <vector>

#include "scope_lockin/entities/AcquisitionData.hpp"
#include "scope_lockin/entities/LockInResult.hpp"
#include "scope_lockin/entities/LockInSettings.hpp"

namespace scope_lockin {
// Checks what can be checked without data: cutoff > 0, order in [1, 10],
// averaging fraction in [0, 1]. Throws ConfigurationError.
void validateLockInSettings(const LockInSettings &settings);

// Quadrature demodulation against a reference synthesized at the fundamental
// of data.refWaveform, low-pass filtered with a single causal Butterworth
// pass. Phase is corrected by the phase of the physical reference and
// unwrapped.
LockInResult performLockIn(const AcquisitionData &data,
                           const LockInSettings &settings);

// Same, also handing back the synthesized references.
LockInResult performLockIn(const AcquisitionData &data,
                           const LockInSettings &settings,
                           ReferenceSignals &references);

// Removes jumps larger than pi by adding multiples of 2 pi.
void unwrapPhase(std::vector<double> &phase);

std::vector<double> buildTimeAxis(const AcquisitionData &data);
}  // namespace scope_lockin
