/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <cmath>

#include <gtest/gtest.h>

#include "scope_lockin/Errors.hpp"
#include "scope_lockin/processing/Averager.hpp"

using namespace scope_lockin;

namespace {
// Amplitude 1 .. count, phase -1 .. -count.
LockInResult rampResult(std::size_t count) {
  LockInResult result;
  for (std::size_t i = 0; i < count; ++i) {
    result.time.push_back(static_cast<double>(i));
    result.amplitude.push_back(static_cast<double>(i + 1));
    result.phaseRadians.push_back(-static_cast<double>(i + 1));
  }
  return result;
}
}  // namespace

TEST(Averager, WholeRecord) {
  const auto result = rampResult(10);
  const auto estimate = computeAveragedEstimate(result, 1.0, 0.0);
  EXPECT_DOUBLE_EQ(estimate.amplitude, 5.5);
  EXPECT_DOUBLE_EQ(estimate.phaseRadians, -5.5);
}

TEST(Averager, TrailingHalf) {
  const auto result = rampResult(10);
  EXPECT_EQ(averagingWindowStart(10, 0.5), 5u);
  const auto estimate = computeAveragedEstimate(result, 0.5, 0.0);
  // Mean of 6 .. 10.
  EXPECT_DOUBLE_EQ(estimate.amplitude, 8.0);
  EXPECT_DOUBLE_EQ(estimate.phaseRadians, -8.0);
}

TEST(Averager, WindowStartRoundsDown) {
  EXPECT_EQ(averagingWindowStart(10, 0.25), 7u);
  EXPECT_EQ(averagingWindowStart(3, 0.5), 1u);
  EXPECT_EQ(averagingWindowStart(1, 1.0), 0u);
}

TEST(Averager, ZeroOrTinyFractionUsesLastSample) {
  const auto result = rampResult(10);
  EXPECT_EQ(averagingWindowStart(10, 0.0), 9u);
  EXPECT_EQ(averagingWindowStart(10, 0.01), 9u);

  const auto estimate = computeAveragedEstimate(result, 0.0, 0.0);
  EXPECT_DOUBLE_EQ(estimate.amplitude, 10.0);
  EXPECT_DOUBLE_EQ(estimate.phaseRadians, -10.0);
}

TEST(Averager, RejectsFractionOutsideUnitInterval) {
  const auto result = rampResult(10);
  EXPECT_THROW(computeAveragedEstimate(result, -0.1, 0.0), ConfigurationError);
  EXPECT_THROW(computeAveragedEstimate(result, 1.1, 0.0), ConfigurationError);
  EXPECT_THROW(averagingWindowStart(10, std::nan("")), ConfigurationError);
}

TEST(Averager, EmptyOrMismatchedResult) {
  EXPECT_THROW(computeAveragedEstimate(LockInResult{}, 0.5, 0.0),
               ProcessingError);

  auto result = rampResult(10);
  result.phaseRadians.pop_back();
  EXPECT_THROW(computeAveragedEstimate(result, 0.5, 0.0), ProcessingError);
}

TEST(Averager, KeepsTimestamp) {
  const auto estimate = computeAveragedEstimate(rampResult(4), 0.5, 12.25);
  EXPECT_DOUBLE_EQ(estimate.timestamp, 12.25);
}
