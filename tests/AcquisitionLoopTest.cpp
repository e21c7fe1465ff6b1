/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

#include <gtest/gtest.h>

#include "SyntheticSignals.hpp"
#include "scope_lockin/AcquisitionLoop.hpp"
#include "scope_lockin/Errors.hpp"
#include "scope_lockin/EstimateChannel.hpp"
#include "scope_lockin/oscilloscope/MockOscilloscope.hpp"

using namespace scope_lockin;
using namespace std::chrono_literals;

namespace {
// Delivers a number of good captures, then fails like a dropped connection.
class FailingOscilloscope : public OscilloscopeInterface {
 public:
  explicit FailingOscilloscope(int goodCaptures) : goodCaptures(goodCaptures) {}

  void configure(const ScopeSettings &) override {}

  AcquisitionData acquire() override {
    if (acquisitions++ >= goodCaptures) {
      throw TransportError("USB connection lost");
    }
    return test::makeTone(1000.0, 100000.0, 2000, 1.0, 0.0);
  }

  void close() override {}
  std::vector<ParameterSpec> parameterSchema() const override { return {}; }
  std::string identity() override { return "failing"; }

  std::atomic<int> acquisitions{0};

 private:
  int goodCaptures;
};

LockInSettings loopSettings() {
  LockInSettings settings;
  settings.lowPassCutoffHz = 100.0;
  return settings;
}

MockOscilloscope makeMock(double referenceAmplitude = 1.0) {
  MockSignal signal;
  signal.signalAmplitude = 2.0;
  signal.referenceAmplitude = referenceAmplitude;
  signal.phaseRadians = test::radians(-45.0);
  MockOscilloscope scope(signal);

  ScopeSettings settings;
  settings.memoryDepth = 10000;
  settings.sampleRateHz = 100000.0;
  scope.configure(settings);
  return scope;
}

bool waitFor(const std::function<bool()> &condition,
             std::chrono::milliseconds timeout = 5000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(1ms);
  }
  return true;
}
}  // namespace

TEST(AcquisitionLoop, DebugRunKeepsIntermediates) {
  auto scope = makeMock();
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);

  const auto run = loop.runOnce(loopSettings());
  EXPECT_EQ(run.data.refWaveform.size(), 10000u);
  EXPECT_EQ(run.result.amplitude.size(), 10000u);
  EXPECT_EQ(run.references.cosine.size(), 10000u);
  EXPECT_NEAR(run.result.fundamentalFreqHz, 1000.0, 10.0);
  EXPECT_NEAR(run.estimate.amplitude, 2.0, 0.04);
  EXPECT_NEAR(test::degrees(run.estimate.phaseRadians), 45.0, 2.0);
  EXPECT_EQ(loop.getCompletedCycles(), 1);
  EXPECT_FALSE(loop.isRunning());
}

TEST(AcquisitionLoop, DeliversEstimatesInCycleOrder) {
  auto scope = makeMock();
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);
  EstimateChannel estimates;
  std::atomic<int> errors{0};

  ASSERT_TRUE(loop.start(
      loopSettings(),
      [&estimates](const AveragedEstimate &estimate) { estimates.push(estimate); },
      [&errors](std::exception_ptr) { ++errors; }));
  EXPECT_TRUE(loop.isRunning());

  std::vector<AveragedEstimate> received;
  while (received.size() < 3) {
    auto estimate = estimates.waitPop(5s);
    ASSERT_TRUE(estimate.has_value());
    received.push_back(*estimate);
  }
  loop.stop();

  EXPECT_FALSE(loop.isRunning());
  EXPECT_EQ(errors.load(), 0);
  EXPECT_LT(received[0].timestamp, received[1].timestamp);
  EXPECT_LT(received[1].timestamp, received[2].timestamp);
  for (const auto &estimate : received) {
    EXPECT_NEAR(estimate.amplitude, 2.0, 0.04);
  }
  // Nothing is produced after stop() returns.
  const auto cycles = loop.getCompletedCycles();
  std::this_thread::sleep_for(30ms);
  EXPECT_EQ(loop.getCompletedCycles(), cycles);
}

TEST(AcquisitionLoop, SecondStartIsRefused) {
  auto scope = makeMock();
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);

  ASSERT_TRUE(loop.start(loopSettings(), nullptr, nullptr));
  EXPECT_FALSE(loop.start(loopSettings(), nullptr, nullptr));
  loop.stop();
  loop.stop();
  EXPECT_FALSE(loop.isRunning());

  // Restartable once stopped.
  ASSERT_TRUE(loop.start(loopSettings(), nullptr, nullptr));
  loop.stop();
}

TEST(AcquisitionLoop, StopWithoutStart) {
  auto scope = makeMock();
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);
  loop.stop();
  EXPECT_EQ(loop.getCompletedCycles(), 0);
}

TEST(AcquisitionLoop, ErrorEndsTheRun) {
  FailingOscilloscope scope(2);
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);
  std::atomic<int> estimates{0};
  std::atomic<int> errors{0};
  std::atomic<bool> wasTransportError{false};

  ASSERT_TRUE(loop.start(
      loopSettings(), [&estimates](const AveragedEstimate &) { ++estimates; },
      [&](std::exception_ptr error) {
        ++errors;
        try {
          std::rethrow_exception(error);
        } catch (const TransportError &) {
          wasTransportError = true;
        } catch (const std::exception &) {
        }
      }));

  ASSERT_TRUE(waitFor([&loop]() { return !loop.isRunning(); }));
  loop.stop();

  EXPECT_EQ(estimates.load(), 2);
  EXPECT_EQ(errors.load(), 1);
  EXPECT_TRUE(wasTransportError.load());
  EXPECT_EQ(scope.acquisitions.load(), 3);
  EXPECT_EQ(loop.getCompletedCycles(), 2);
}

TEST(AcquisitionLoop, SilentReferenceIsReportedAsProcessingError) {
  auto scope = makeMock(0.0);
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);
  std::atomic<bool> wasProcessingError{false};

  ASSERT_TRUE(loop.start(loopSettings(), nullptr,
                         [&wasProcessingError](std::exception_ptr error) {
                           try {
                             std::rethrow_exception(error);
                           } catch (const ProcessingError &) {
                             wasProcessingError = true;
                           } catch (const std::exception &) {
                           }
                         }));
  ASSERT_TRUE(waitFor([&loop]() { return !loop.isRunning(); }));
  EXPECT_TRUE(wasProcessingError.load());
  EXPECT_EQ(loop.getCompletedCycles(), 0);
}

TEST(AcquisitionLoop, NonStandardExceptionFromCallbackEndsTheRun) {
  auto scope = makeMock();
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);
  std::atomic<int> errors{0};
  std::atomic<bool> caughtInt{false};

  ASSERT_TRUE(loop.start(
      loopSettings(), [](const AveragedEstimate &) { throw 42; },
      [&](std::exception_ptr error) {
        ++errors;
        try {
          std::rethrow_exception(error);
        } catch (int) {
          caughtInt = true;
        } catch (...) {
        }
      }));

  ASSERT_TRUE(waitFor([&loop]() { return !loop.isRunning(); }));
  loop.stop();
  EXPECT_EQ(errors.load(), 1);
  EXPECT_TRUE(caughtInt.load());
  EXPECT_EQ(loop.getCompletedCycles(), 1);

  // The loop can be started again afterwards.
  ASSERT_TRUE(loop.start(loopSettings(), nullptr, nullptr));
  loop.stop();
}

TEST(AcquisitionLoop, StopFromCallbackFinishesCurrentCycle) {
  auto scope = makeMock();
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);
  std::atomic<int> estimates{0};

  ASSERT_TRUE(loop.start(
      loopSettings(),
      [&](const AveragedEstimate &) {
        ++estimates;
        loop.stop();
      },
      nullptr));

  ASSERT_TRUE(waitFor([&loop]() { return !loop.isRunning(); }));
  EXPECT_EQ(estimates.load(), 1);
  EXPECT_EQ(loop.getCompletedCycles(), 1);
}

TEST(AcquisitionLoop, InvalidSettingsAreRejectedUpFront) {
  auto scope = makeMock();
  AcquisitionLoop loop(scope, LogContext{"loop"}, 5ms);

  auto settings = loopSettings();
  settings.filterOrder = 12;
  EXPECT_THROW(loop.start(settings, nullptr, nullptr), ConfigurationError);
  EXPECT_THROW(loop.runOnce(settings), ConfigurationError);
  EXPECT_FALSE(loop.isRunning());
  EXPECT_EQ(scope.getAcquireCount(), 0);
}
