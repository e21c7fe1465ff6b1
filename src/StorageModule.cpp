/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/StorageModule.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

#include <date/date.h>
#include <date/tz.h>

#include "loguru/loguru.hpp"

namespace scope_lockin {
namespace {
constexpr double kDegreesPerRadian = 180.0 / 3.14159265358979323846264338327950288;
}

std::string StorageModule::getLocalTimestampString(
    const std::chrono::system_clock::time_point &timePoint) {
  auto localTimePoint = date::make_zoned(
      date::current_zone(), date::floor<std::chrono::milliseconds>(timePoint));

  return date::format("%FT%H_%M_%S", localTimePoint);
}

std::string StorageModule::getUTCTimestampString(
    const std::chrono::system_clock::time_point &timePoint) {
  return date::format("%FT%H_%M_%S",
                      date::floor<std::chrono::milliseconds>(timePoint));
}

bool StorageModule::setup(const fs::path &storageDirectoryPath) {
  if (!fs::is_directory(storageDirectoryPath)) {
    LOG_S(ERROR) << "Storage directory does not exist: "
                 << storageDirectoryPath;
    return false;
  }
  this->storageDirectory = storageDirectoryPath;
  return true;
}

fs::path StorageModule::buildFilePath(
    const std::string &kind, const std::string &label,
    const std::chrono::system_clock::time_point &measurementTimestamp) const {
  std::ostringstream fileName;
  fileName << "lockin_" << kind << "_";
  fileName << getUTCTimestampString(measurementTimestamp);
  if (!label.empty()) {
    fileName << "_" << label;
  }
  fileName << ".csv";
  return storageDirectory / fileName.str();
}

bool StorageModule::storeEstimates(
    const std::vector<AveragedEstimate> &estimates, const std::string &label,
    const std::chrono::system_clock::time_point &measurementTimestamp) const {
  if (storageDirectory.empty()) {
    LOG_S(ERROR) << "Storage module is not set up.";
    return false;
  }
  if (estimates.empty()) {
    LOG_S(WARNING) << "No estimates to store.";
    return false;
  }

  const auto dataFilePath = buildFilePath("estimates", label, measurementTimestamp);
  auto dataFile = std::fstream(dataFilePath, std::ios::out);
  if (!dataFile) {
    LOG_S(ERROR) << "Could not create data file " << dataFilePath;
    return false;
  }

  dataFile.precision(std::numeric_limits<double>::max_digits10);
  dataFile << "Time [s],Amplitude [V],Phase [deg]" << std::endl;
  for (const auto &estimate : estimates) {
    dataFile << estimate.timestamp << "," << estimate.amplitude << ","
             << estimate.phaseRadians * kDegreesPerRadian << "\n";
  }

  dataFile.close();
  lastFilePath = dataFilePath;

  LOG_S(INFO) << "Lock-in estimates stored to file: " << dataFilePath.string();

  return dataFile.good();
}

bool StorageModule::storeDebugRun(
    const DebugRun &debugRun, const std::string &label,
    const std::chrono::system_clock::time_point &measurementTimestamp) const {
  if (storageDirectory.empty()) {
    LOG_S(ERROR) << "Storage module is not set up.";
    return false;
  }

  const auto &data = debugRun.data;
  const auto &result = debugRun.result;
  const auto &references = debugRun.references;
  const std::size_t count = result.time.size();
  if (data.refWaveform.size() != count ||
      data.acquisitionWaveform.size() != count ||
      references.cosine.size() != count || references.sine.size() != count ||
      result.amplitude.size() != count || result.phaseRadians.size() != count) {
    LOG_S(ERROR) << "Debug run sequences differ in length, not stored.";
    return false;
  }

  const auto dataFilePath = buildFilePath("debug", label, measurementTimestamp);
  auto dataFile = std::fstream(dataFilePath, std::ios::out);
  if (!dataFile) {
    LOG_S(ERROR) << "Could not create data file " << dataFilePath;
    return false;
  }

  dataFile << "Time [s],Reference [V],Acquisition [V],Cosine Reference,"
              "Sine Reference,Amplitude [V],Phase [deg]"
           << std::endl;
  for (std::size_t i = 0; i < count; ++i) {
    dataFile << result.time[i] << "," << data.refWaveform[i] << ","
             << data.acquisitionWaveform[i] << "," << references.cosine[i]
             << "," << references.sine[i] << "," << result.amplitude[i] << ","
             << result.phaseRadians[i] * kDegreesPerRadian << "\n";
  }

  dataFile.close();
  lastFilePath = dataFilePath;

  LOG_S(INFO) << "Debug run (" << result.fundamentalFreqHz
              << " Hz) stored to file: " << dataFilePath.string();

  return dataFile.good();
}
}  // namespace scope_lockin
