/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <array>
#include <string>

namespace scope_lockin {
    enum class Channel {
        CH1,
        CH2,
        CH3,
        CH4
    };

    constexpr std::array<Channel, 4> allChannels = {Channel::CH1, Channel::CH2, Channel::CH3, Channel::CH4};

    // 1-based channel index as used in SCPI commands.
    inline int channelNumber(Channel channel) {
        return static_cast<int>(channel) + 1;
    }

    namespace Enum {
        inline std::string toString(Channel channel) {
            return "CH" + std::to_string(channelNumber(channel));
        }
    }
}
