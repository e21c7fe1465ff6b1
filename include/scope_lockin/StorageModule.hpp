/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "scope_lockin/entities/AveragedEstimate.hpp"
#include "scope_lockin/entities/DebugRun.hpp"

namespace fs = std::filesystem;

namespace scope_lockin {
class StorageModule {
 public:
  static std::string getLocalTimestampString(
      const std::chrono::system_clock::time_point &timePoint);
  static std::string getUTCTimestampString(
      const std::chrono::system_clock::time_point &timePoint);

  bool setup(const fs::path &storageDirectoryPath);

  bool storeEstimates(
      const std::vector<AveragedEstimate> &estimates, const std::string &label,
      const std::chrono::system_clock::time_point &measurementTimestamp) const;

  bool storeDebugRun(
      const DebugRun &debugRun, const std::string &label,
      const std::chrono::system_clock::time_point &measurementTimestamp) const;

  const fs::path &getLastFilePath() const { return lastFilePath; }

 private:
  fs::path buildFilePath(
      const std::string &kind, const std::string &label,
      const std::chrono::system_clock::time_point &measurementTimestamp) const;

  fs::path storageDirectory;
  mutable fs::path lastFilePath;
};
}  // namespace scope_lockin
