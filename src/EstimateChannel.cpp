/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/EstimateChannel.hpp"

namespace scope_lockin {
void EstimateChannel::push(const AveragedEstimate &estimate) {
  {
    std::lock_guard<std::mutex> lock(mtx);
    if (closed) {
      return;
    }
    buffer.push_back(estimate);
  }
  cond.notify_one();
}

void EstimateChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mtx);
    closed = true;
  }
  cond.notify_all();
}

std::optional<AveragedEstimate> EstimateChannel::waitPop(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx);
  cond.wait_for(lock, timeout, [this] { return !buffer.empty() || closed; });
  if (buffer.empty()) {
    return std::nullopt;
  }
  auto estimate = buffer.front();
  buffer.pop_front();
  return estimate;
}

std::vector<AveragedEstimate> EstimateChannel::drain() {
  std::lock_guard<std::mutex> lock(mtx);
  std::vector<AveragedEstimate> estimates(buffer.begin(), buffer.end());
  buffer.clear();
  return estimates;
}

bool EstimateChannel::isClosed() const {
  std::lock_guard<std::mutex> lock(mtx);
  return closed;
}
}  // namespace scope_lockin
