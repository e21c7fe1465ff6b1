/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

namespace scope_lockin {
    struct LockInSettings {
        double lowPassCutoffHz = 10.0;
        int filterOrder = 4;
        double averagingFraction = 0.5; // trailing part of the record to average
    };
}
