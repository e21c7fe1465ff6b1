/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "AcquisitionData.hpp"
#include "AveragedEstimate.hpp"
#include "LockInResult.hpp"

namespace scope_lockin {
    struct DebugRun {
        AcquisitionData data;
        LockInResult result;
        ReferenceSignals references;
        AveragedEstimate estimate;
    };
}
