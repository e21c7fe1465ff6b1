/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>
#include <vector>

#include "scope_lockin/entities/AcquisitionData.hpp"
#include "scope_lockin/entities/ScopeSettings.hpp"

namespace scope_lockin {
// Capability the lock-in core consumes. Variants differ in how they talk to
// the hardware; the core never depends on a concrete one.
class OscilloscopeInterface {
 public:
  virtual ~OscilloscopeInterface() = default;

  // Throws ConfigurationError for disallowed values before touching the
  // device.
  virtual void configure(const ScopeSettings &settings) = 0;

  // One complete, fully scaled capture, or an exception.
  virtual AcquisitionData acquire() = 0;

  // Idempotent.
  virtual void close() = 0;

  virtual std::vector<ParameterSpec> parameterSchema() const = 0;

  virtual std::string identity() = 0;
};

// Validation shared by the variants, checked against their schema.
void validateScopeSettings(const ScopeSettings &settings,
                           const std::vector<ParameterSpec> &schema);

const ParameterSpec &findParameter(const std::vector<ParameterSpec> &schema,
                                   const std::string &name);
}  // namespace scope_lockin
