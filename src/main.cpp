/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

#include "loguru/loguru.hpp"
#include "scope_lockin/AcquisitionLoop.hpp"
#include "scope_lockin/CommandLine.hpp"
#include "scope_lockin/Errors.hpp"
#include "scope_lockin/EstimateChannel.hpp"
#include "scope_lockin/StorageModule.hpp"
#include "scope_lockin/oscilloscope/MockOscilloscope.hpp"
#include "scope_lockin/processing/ButterworthLowPass.hpp"

using namespace scope_lockin;

namespace {
constexpr double kDegreesPerRadian = 180.0 / 3.14159265358979323846264338327950288;

// Larger than any depth a scope variant accepts.
constexpr long long kMaxMemoryDepth = 1000000000LL;

std::atomic<bool> g_stop(false);

void onInterrupt(int sig) {
  if (sig == SIGINT) {
    g_stop.store(true);
  }
}

void help() {
  fprintf(stderr,
          "scope_lockin [general options] [lock-in options] [mock scope options]\n"
          "\n"
          "  [general options]:\n"
          "    --help                     : this message...\n"
          "    --cycles <n>               : number of estimates to collect (default 10)\n"
          "    --debug-run                : run a single cycle and keep the full traces\n"
          "    --output-dir <dir>         : store results as CSV in this directory\n"
          "    --logfile <path>           : also write log messages to this file\n"
          "    -v <level>                 : console verbosity (loguru, e.g. -v 1 for traces)\n"
          "\n"
          "  [lock-in options]:\n"
          "    --cutoff <hz>              : low-pass cutoff (default 10)\n"
          "    --order <n>                : Butterworth order, 1..10 (default 4)\n"
          "    --averaging <fraction>     : trailing fraction to average, 0..1 (default 0.5)\n"
          "\n"
          "  [acquisition options]:\n"
          "    --memory-depth <n>         : samples per channel (default 100000)\n"
          "    --sample-rate <hz>         : sample rate (default 100000)\n"
          "    --ref-channel <1-4>        : reference channel (default 1)\n"
          "    --acq-channel <1-4>        : signal channel (default 2)\n"
          "\n"
          "  [mock scope options]:\n"
          "    --mock-frequency <hz>      : reference frequency (default 1000)\n"
          "    --mock-amplitude <v>       : signal amplitude (default 1)\n"
          "    --mock-phase <deg>         : signal phase relative to the reference (default 0)\n"
          "    --mock-noise <v>           : standard deviation of added noise (default 0)\n");
}

void printEstimate(const AveragedEstimate &estimate) {
  printf("%10.3f s  amplitude %.6g V  phase %.3f deg\n", estimate.timestamp,
         estimate.amplitude, estimate.phaseRadians * kDegreesPerRadian);
}
}  // namespace

int main(int argc, char *argv[]) {
  // Let the logger eat its args first
  loguru::init(argc, argv);

  int cycles = 10;
  bool debugRun = false;
  std::string outputDir;
  std::string logfile;

  LockInSettings lockInSettings;
  ScopeSettings scopeSettings;
  scopeSettings.memoryDepth = 100000;
  scopeSettings.sampleRateHz = 100000;
  MockSignal mockSignal;

  for (int i = 1; i < argc; i++) {
    std::string s(argv[i]);
    const bool hasValue = i + 1 < argc;
    double number = 0;
    long long count = 0;

    if (s == "--help") {
      help();
      return 0;
    } else if (s == "--debug-run") {
      debugRun = true;
    } else if (!hasValue && s.rfind("--", 0) == 0) {
      fprintf(stderr, "Missing value for \"%s\", use --help\n", s.c_str());
      return 1;
    } else if (s == "--cycles") {
      if (!parseInteger(s, argv[++i], 1, std::numeric_limits<int>::max(), count))
        return 1;
      cycles = static_cast<int>(count);
    } else if (s == "--output-dir") {
      outputDir = argv[++i];
    } else if (s == "--logfile") {
      logfile = argv[++i];
    } else if (s == "--cutoff") {
      if (!parseNumber(s, argv[++i], lockInSettings.lowPassCutoffHz))
        return 1;
    } else if (s == "--order") {
      if (!parseInteger(s, argv[++i], kMinFilterOrder, kMaxFilterOrder, count))
        return 1;
      lockInSettings.filterOrder = static_cast<int>(count);
    } else if (s == "--averaging") {
      if (!parseNumber(s, argv[++i], lockInSettings.averagingFraction))
        return 1;
    } else if (s == "--memory-depth") {
      if (!parseInteger(s, argv[++i], 1, kMaxMemoryDepth, count))
        return 1;
      scopeSettings.memoryDepth = static_cast<std::size_t>(count);
    } else if (s == "--sample-rate") {
      if (!parseNumber(s, argv[++i], scopeSettings.sampleRateHz))
        return 1;
    } else if (s == "--ref-channel") {
      if (!parseChannel(s, argv[++i], scopeSettings.referenceChannel))
        return 1;
    } else if (s == "--acq-channel") {
      if (!parseChannel(s, argv[++i], scopeSettings.acquisitionChannel))
        return 1;
    } else if (s == "--mock-frequency") {
      if (!parseNumber(s, argv[++i], mockSignal.frequencyHz))
        return 1;
    } else if (s == "--mock-amplitude") {
      if (!parseNumber(s, argv[++i], mockSignal.signalAmplitude))
        return 1;
    } else if (s == "--mock-phase") {
      if (!parseNumber(s, argv[++i], number))
        return 1;
      mockSignal.phaseRadians = number / kDegreesPerRadian;
    } else if (s == "--mock-noise") {
      if (!parseNumber(s, argv[++i], mockSignal.noiseStdDev))
        return 1;
    } else {
      fprintf(stderr, "Unrecognized command-line argument \"%s\", use --help\n",
              s.c_str());
      return 1;
    }
  }

  if (!logfile.empty()) {
    loguru::add_file(logfile.c_str(), loguru::Append, loguru::Verbosity_MAX);
  }
  std::signal(SIGINT, onInterrupt);

  StorageModule storage;
  if (!outputDir.empty() && !storage.setup(outputDir)) {
    return 1;
  }

  const LogContext rootLog{"scope_lockin", 1};
  MockOscilloscope scope(mockSignal, rootLog.child("mock"));
  LOG_S(INFO) << "Using " << scope.identity();

  try {
    scope.configure(scopeSettings);
    validateLockInSettings(lockInSettings);
  } catch (const LockInError &e) {
    LOG_S(ERROR) << "Configuration rejected: " << e.what();
    return 1;
  }

  AcquisitionLoop loop(scope, rootLog.child("loop"));
  const auto startedAt = std::chrono::system_clock::now();
  LOG_S(INFO) << "Run started at "
              << StorageModule::getLocalTimestampString(startedAt)
              << " local time";

  if (debugRun) {
    DebugRun run;
    try {
      run = loop.runOnce(lockInSettings);
    } catch (const LockInError &e) {
      LOG_S(ERROR) << "Debug run failed: " << e.what();
      scope.close();
      return 1;
    }
    printf("Fundamental frequency: %.3f Hz (resolution %.3f Hz)\n",
           run.result.fundamentalFreqHz,
           1.0 / (run.data.timeIncrement * run.data.refWaveform.size()));
    printEstimate(run.estimate);
    scope.close();
    if (!outputDir.empty() && !storage.storeDebugRun(run, "mock", startedAt)) {
      return 1;
    }
    return 0;
  }

  EstimateChannel channel;
  std::atomic<bool> failed(false);
  const bool started = loop.start(
      lockInSettings,
      [&channel](const AveragedEstimate &estimate) { channel.push(estimate); },
      [&channel, &failed](std::exception_ptr) {
        failed.store(true);
        channel.close();
      });
  if (!started) {
    scope.close();
    return 1;
  }

  std::vector<AveragedEstimate> estimates;
  while (static_cast<int>(estimates.size()) < cycles && !g_stop.load()) {
    auto estimate = channel.waitPop(std::chrono::milliseconds(250));
    if (estimate) {
      printEstimate(*estimate);
      estimates.push_back(*estimate);
    } else if (channel.isClosed()) {
      break;
    }
  }

  loop.stop();
  scope.close();

  if (g_stop.load()) {
    LOG_S(WARNING) << "Interrupted after " << estimates.size() << " estimates";
  }
  if (!outputDir.empty() && !estimates.empty() &&
      !storage.storeEstimates(estimates, "mock", startedAt)) {
    return 1;
  }
  return failed.load() ? 1 : 0;
}
