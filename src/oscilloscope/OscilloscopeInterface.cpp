/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/oscilloscope/OscilloscopeInterface.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
namespace {
std::string describeAllowed(const ParameterSpec &parameter) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < parameter.allowedValues.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << parameter.allowedValues[i];
  }
  out << "]";
  return out.str();
}

void requireAllowed(const ParameterSpec &parameter, double value) {
  if (!std::isfinite(value) || value <= 0.0) {
    std::ostringstream message;
    message << "Invalid value for '" << parameter.name << "': " << value
            << ". Value must be positive.";
    throw ConfigurationError(message.str());
  }
  if (parameter.allowedValues.empty()) {
    return;
  }
  if (std::find(parameter.allowedValues.begin(), parameter.allowedValues.end(),
                value) == parameter.allowedValues.end()) {
    std::ostringstream message;
    message << "Invalid value for '" << parameter.name << "': " << value
            << ". Allowed values are " << describeAllowed(parameter) << ".";
    throw ConfigurationError(message.str());
  }
}
}  // namespace

const ParameterSpec &findParameter(const std::vector<ParameterSpec> &schema,
                                   const std::string &name) {
  for (const auto &parameter : schema) {
    if (parameter.name == name) {
      return parameter;
    }
  }
  throw ConfigurationError("Unknown parameter '" + name + "'");
}

void validateScopeSettings(const ScopeSettings &settings,
                           const std::vector<ParameterSpec> &schema) {
  if (settings.referenceChannel == settings.acquisitionChannel) {
    throw ConfigurationError("Reference and acquisition channel must differ, both are " +
                             Enum::toString(settings.referenceChannel));
  }

  requireAllowed(findParameter(schema, "memory_depth"),
                 static_cast<double>(settings.memoryDepth));

  // A sample rate of 0 leaves the timebase untouched.
  if (settings.sampleRateHz != 0.0) {
    requireAllowed(findParameter(schema, "sample_rate"), settings.sampleRateHz);
  }

  for (const auto &entry : settings.channelRangesVolts) {
    if (entry.first != settings.referenceChannel &&
        entry.first != settings.acquisitionChannel) {
      throw ConfigurationError("Range given for unused channel " +
                               Enum::toString(entry.first));
    }
    requireAllowed(findParameter(schema, "channel_range"), entry.second);
  }
}
}  // namespace scope_lockin
