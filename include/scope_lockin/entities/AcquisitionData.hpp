/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <vector>
#pragma once

namespace scope_lockin {
    // One capture of the reference/acquisition channel pair, in volts.
    struct AcquisitionData {
        std::vector<float> refWaveform;
        std::vector<float> acquisitionWaveform;
        double timeIncrement = 0.0; // seconds per sample
        double timeOrigin = 0.0;
    };
}
