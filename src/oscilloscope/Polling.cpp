/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/oscilloscope/Polling.hpp"

#include <thread>

#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
void pollUntil(const std::function<bool()> &isDone,
               std::chrono::milliseconds pollInterval,
               std::chrono::milliseconds maxWait, const std::string &what) {
  const auto started = std::chrono::steady_clock::now();
  while (!isDone()) {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed >= maxWait) {
      throw AcquisitionTimeoutError(
          what + " did not complete within " + std::to_string(maxWait.count()) +
          " ms");
    }
    // Never sleep past the deadline.
    const auto remaining = maxWait - elapsed;
    std::this_thread::sleep_for(
        remaining < pollInterval
            ? std::chrono::duration_cast<std::chrono::milliseconds>(remaining)
            : pollInterval);
  }
}
}  // namespace scope_lockin
