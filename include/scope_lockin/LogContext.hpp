/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>

namespace scope_lockin {
// Handed to components at construction instead of each of them picking its
// own logger. Messages are prefixed with the component name; per-cycle trace
// output goes to VLOG_S(traceVerbosity).
struct LogContext {
  std::string name;
  int traceVerbosity = 1;

  LogContext child(const std::string &component) const {
    return LogContext{name.empty() ? component : name + "/" + component,
                      traceVerbosity};
  }
};
}  // namespace scope_lockin
