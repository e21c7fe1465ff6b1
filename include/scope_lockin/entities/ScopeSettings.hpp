/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "Channel.hpp"

namespace scope_lockin {
    struct ScopeSettings {
        std::size_t memoryDepth = 0;
        double sampleRateHz = 0.0; // 0: keep the instrument's timebase
        std::map<Channel, double> channelRangesVolts;
        Channel referenceChannel = Channel::CH1;
        Channel acquisitionChannel = Channel::CH2;
    };

    enum class ParameterType {
        INTEGER,
        REAL,
        CHANNEL
    };

    // One configurable parameter of an oscilloscope variant. An empty
    // allowedValues list accepts any positive value.
    struct ParameterSpec {
        std::string name;
        ParameterType type;
        std::vector<double> allowedValues;
        double defaultValue;
    };
}
