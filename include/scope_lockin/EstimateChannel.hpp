/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "scope_lockin/entities/AveragedEstimate.hpp"

namespace scope_lockin {
// One-way FIFO handing estimates from the acquisition worker to a consumer
// thread.
class EstimateChannel {
 public:
  void push(const AveragedEstimate &estimate);

  // Wakes all waiters; already queued estimates can still be popped.
  void close();

  // Empty on timeout, or once the channel is closed and drained.
  std::optional<AveragedEstimate> waitPop(std::chrono::milliseconds timeout);

  std::vector<AveragedEstimate> drain();

  bool isClosed() const;

 private:
  mutable std::mutex mtx;
  std::condition_variable cond;
  std::deque<AveragedEstimate> buffer;
  bool closed = false;
};
}  // namespace scope_lockin
