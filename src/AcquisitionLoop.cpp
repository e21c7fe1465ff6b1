/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/AcquisitionLoop.hpp"

#include <system_error>

#include "loguru/loguru.hpp"
#include "scope_lockin/processing/Averager.hpp"
#include "scope_lockin/processing/LockInProcessor.hpp"

namespace scope_lockin {
AcquisitionLoop::AcquisitionLoop(OscilloscopeInterface &scope, LogContext log,
                                 std::chrono::milliseconds cycleDelay)
    : scope(scope),
      log(std::move(log)),
      cycleDelay(cycleDelay),
      epoch(std::chrono::steady_clock::now()) {}

AcquisitionLoop::~AcquisitionLoop() { stop(); }

double AcquisitionLoop::secondsSinceEpoch() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch)
      .count();
}

bool AcquisitionLoop::start(const LockInSettings &settings,
                            EstimateCallback onEstimate,
                            ErrorCallback onError) {
  validateLockInSettings(settings);

  std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
  if (running.load()) {
    LOG_S(WARNING) << log.name << ": acquisition already running";
    return false;
  }
  // A previous run may have ended on its own after an error.
  if (worker.joinable()) {
    worker.join();
  }

  {
    std::lock_guard<std::mutex> lock(stopMutex);
    stopRequested = false;
  }
  running.store(true);
  try {
    worker = std::thread(&AcquisitionLoop::run, this, settings,
                         std::move(onEstimate), std::move(onError));
  } catch (const std::system_error &e) {
    running.store(false);
    LOG_S(ERROR) << log.name << ": could not start the worker: " << e.what();
    throw;
  }
  LOG_S(INFO) << log.name << ": acquisition started";
  return true;
}

void AcquisitionLoop::requestStop() {
  {
    std::lock_guard<std::mutex> lock(stopMutex);
    stopRequested = true;
  }
  stopCondition.notify_all();
}

void AcquisitionLoop::stop() {
  if (workerId.load() == std::this_thread::get_id()) {
    // Called from a callback; the loop exits after the current cycle and the
    // thread is joined by the next start(), stop() or the destructor.
    requestStop();
    return;
  }

  std::lock_guard<std::mutex> lifecycle(lifecycleMutex);
  requestStop();
  if (worker.joinable()) {
    worker.join();
    LOG_S(INFO) << log.name << ": acquisition stopped after "
                << completedCycles.load() << " cycles";
  }
}

DebugRun AcquisitionLoop::runOnce(const LockInSettings &settings) {
  validateLockInSettings(settings);
  auto debugRun = runCycle(settings);
  LOG_S(INFO) << log.name << ": debug run, fundamental "
              << debugRun.result.fundamentalFreqHz << " Hz, amplitude "
              << debugRun.estimate.amplitude << " V, phase "
              << debugRun.estimate.phaseRadians << " rad";
  return debugRun;
}

DebugRun AcquisitionLoop::runCycle(const LockInSettings &settings) {
  std::lock_guard<std::mutex> cycle(cycleMutex);

  DebugRun debugRun;
  debugRun.data = scope.acquire();
  debugRun.result = performLockIn(debugRun.data, settings, debugRun.references);
  debugRun.estimate = computeAveragedEstimate(
      debugRun.result, settings.averagingFraction, secondsSinceEpoch());
  ++completedCycles;
  return debugRun;
}

void AcquisitionLoop::endRun(const ErrorCallback &onError,
                             std::exception_ptr error) {
  if (onError) {
    try {
      onError(error);
    } catch (const std::exception &callbackError) {
      LOG_S(ERROR) << log.name << ": error callback failed: "
                   << callbackError.what();
    } catch (...) {
      LOG_S(ERROR) << log.name << ": error callback failed";
    }
  }
  workerId.store(std::thread::id());
  running.store(false);
}

void AcquisitionLoop::run(LockInSettings settings, EstimateCallback onEstimate,
                          ErrorCallback onError) {
  workerId.store(std::this_thread::get_id());
  loguru::set_thread_name("lockin loop");

  while (true) {
    {
      std::lock_guard<std::mutex> lock(stopMutex);
      if (stopRequested) {
        break;
      }
    }

    try {
      const auto debugRun = runCycle(settings);
      VLOG_S(log.traceVerbosity)
          << log.name << ": cycle " << completedCycles.load() << " f="
          << debugRun.result.fundamentalFreqHz
          << " Hz A=" << debugRun.estimate.amplitude
          << " V phi=" << debugRun.estimate.phaseRadians << " rad";
      if (onEstimate) {
        onEstimate(debugRun.estimate);
      }
    } catch (const std::exception &e) {
      LOG_S(ERROR) << log.name << ": error in acquisition loop: " << e.what();
      endRun(onError, std::current_exception());
      return;
    } catch (...) {
      LOG_S(ERROR) << log.name << ": unknown error in acquisition loop";
      endRun(onError, std::current_exception());
      return;
    }

    // Throttles requests to the instrument; wakes early on stop().
    std::unique_lock<std::mutex> lock(stopMutex);
    stopCondition.wait_for(lock, cycleDelay, [this]() { return stopRequested; });
  }

  workerId.store(std::thread::id());
  running.store(false);
}
}  // namespace scope_lockin
