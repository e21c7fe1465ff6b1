/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <vector>

#include <Iir.h>

namespace scope_lockin {
constexpr int kMinFilterOrder = 1;
constexpr int kMaxFilterOrder = 10;

// Causal Butterworth low-pass. Every call to apply() starts from a cleared
// filter state, so the first samples of each sequence carry the start-up
// transient.
class ButterworthLowPass {
 public:
  // Throws ConfigurationError for an order outside [1, 10] or a cutoff that
  // is not strictly between 0 and the Nyquist frequency.
  ButterworthLowPass(int order, double cutoffHz, double sampleRateHz);

  std::vector<double> apply(const std::vector<double> &input);

  int getOrder() const { return order; }
  double getNormalizedCutoff() const { return normalizedCutoff; }

 private:
  int order;
  double normalizedCutoff; // cutoff / Nyquist
  Iir::Butterworth::LowPass<kMaxFilterOrder> filter;
};
}  // namespace scope_lockin
