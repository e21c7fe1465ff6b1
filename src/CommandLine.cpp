/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/CommandLine.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace scope_lockin {
bool parseNumber(const std::string &option, const char *text, double &value) {
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(text, &consumed);
    if (consumed == std::string(text).size()) {
      value = parsed;
      return true;
    }
  } catch (const std::logic_error &) {
    // reported below
  }
  fprintf(stderr, "Invalid number \"%s\" for %s\n", text, option.c_str());
  return false;
}

bool parseInteger(const std::string &option, const char *text, long long min,
                  long long max, long long &value) {
  double number = 0;
  if (!parseNumber(option, text, number)) {
    return false;
  }
  // Compared as double before the cast, which is undefined out of range.
  if (!(number >= static_cast<double>(min) &&
        number <= static_cast<double>(max)) ||
      std::floor(number) != number) {
    fprintf(stderr, "%s must be a whole number in %lld..%lld, got \"%s\"\n",
            option.c_str(), min, max, text);
    return false;
  }
  value = static_cast<long long>(number);
  return true;
}

bool parseChannel(const std::string &option, const char *text,
                  Channel &channel) {
  long long number = 0;
  if (!parseInteger(option, text, 1, 4, number)) {
    return false;
  }
  for (const auto candidate : allChannels) {
    if (channelNumber(candidate) == number) {
      channel = candidate;
      return true;
    }
  }
  return false;
}
}  // namespace scope_lockin
