/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>

#include "scope_lockin/entities/Channel.hpp"

namespace scope_lockin {
// Option value parsers for the command line. Each prints a message to stderr
// and returns false on bad input, leaving the output untouched.
bool parseNumber(const std::string &option, const char *text, double &value);

// Whole number within [min, max].
bool parseInteger(const std::string &option, const char *text, long long min,
                  long long max, long long &value);

bool parseChannel(const std::string &option, const char *text,
                  Channel &channel);
}  // namespace scope_lockin
