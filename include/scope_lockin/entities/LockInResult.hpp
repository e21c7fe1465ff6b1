/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <vector>
#pragma once

namespace scope_lockin {
    struct LockInResult {
        std::vector<double> time;
        std::vector<double> amplitude;
        std::vector<double> phaseRadians; // unwrapped, corrected by the reference phase
        double fundamentalFreqHz = 0.0;
    };

    // Zero-phase demodulation references at the fundamental frequency.
    struct ReferenceSignals {
        std::vector<double> cosine;
        std::vector<double> sine;
    };
}
