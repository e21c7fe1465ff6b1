/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

#include "scope_lockin/LogContext.hpp"
#include "scope_lockin/entities/AveragedEstimate.hpp"
#include "scope_lockin/entities/DebugRun.hpp"
#include "scope_lockin/entities/LockInSettings.hpp"
#include "scope_lockin/oscilloscope/OscilloscopeInterface.hpp"

namespace scope_lockin {
class AcquisitionLoop {
 public:
  using EstimateCallback = std::function<void(const AveragedEstimate &)>;
  using ErrorCallback = std::function<void(std::exception_ptr)>;

  AcquisitionLoop(OscilloscopeInterface &scope, LogContext log,
                  std::chrono::milliseconds cycleDelay =
                      std::chrono::milliseconds(100));
  ~AcquisitionLoop();

  AcquisitionLoop(const AcquisitionLoop &) = delete;
  AcquisitionLoop &operator=(const AcquisitionLoop &) = delete;

  // Runs acquire/process/average cycles on a worker thread until stop() or
  // the first error. Callbacks are invoked on the worker, one at a time, in
  // cycle order. Returns false if a run is already active. Throws
  // ConfigurationError for invalid settings.
  bool start(const LockInSettings &settings, EstimateCallback onEstimate,
             ErrorCallback onError);

  // Cancellation is observed between cycles; a capture in progress finishes
  // (or times out) first.
  void stop();

  // One cycle on the calling thread. Errors propagate.
  DebugRun runOnce(const LockInSettings &settings);

  bool isRunning() const { return running.load(); }

  int getCompletedCycles() const { return completedCycles.load(); }

 private:
  void run(LockInSettings settings, EstimateCallback onEstimate,
           ErrorCallback onError);
  DebugRun runCycle(const LockInSettings &settings);
  // Reports a failed cycle and marks the run as finished.
  void endRun(const ErrorCallback &onError, std::exception_ptr error);
  void requestStop();
  double secondsSinceEpoch() const;

  OscilloscopeInterface &scope;
  LogContext log;
  std::chrono::milliseconds cycleDelay;
  std::chrono::steady_clock::time_point epoch;

  std::thread worker;
  std::atomic<std::thread::id> workerId{};
  std::atomic<bool> running{false};
  std::atomic<int> completedCycles{0};
  bool stopRequested = false;
  std::mutex stopMutex;
  std::condition_variable stopCondition;
  std::mutex lifecycleMutex;
  std::mutex cycleMutex;
};
}  // namespace scope_lockin
