/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace scope_lockin {
// Calls isDone every pollInterval until it returns true. Throws
// AcquisitionTimeoutError (mentioning what) once maxWait has elapsed; the
// overshoot is at most one interval plus one isDone call.
void pollUntil(const std::function<bool()> &isDone,
               std::chrono::milliseconds pollInterval,
               std::chrono::milliseconds maxWait, const std::string &what);
}  // namespace scope_lockin
