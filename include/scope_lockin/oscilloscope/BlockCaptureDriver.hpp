/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "scope_lockin/entities/Channel.hpp"

namespace scope_lockin {
// Boundary to a block-mode USB scope SDK (PicoScope 6000E style). A binding
// translates these calls to the vendor API and reports failures as
// TransportError.
class BlockCaptureDriver {
 public:
  virtual ~BlockCaptureDriver() = default;

  virtual void setChannelOn(Channel channel, double rangeVolts) = 0;
  virtual void setChannelOff(Channel channel) = 0;

  // Free running capture, no trigger condition.
  virtual void disableTrigger() = 0;

  // Returns the closest achievable sample interval in seconds for the given
  // channel set.
  virtual double nearestSampleInterval(const std::vector<Channel> &enabled,
                                       double requestedInterval) = 0;

  virtual void runBlock(std::size_t samples) = 0;
  virtual bool isReady() = 0;
  virtual std::vector<int16_t> getValues(Channel channel,
                                         std::size_t samples) = 0;

  // Full-scale ADC code at the configured resolution.
  virtual int16_t maxAdcValue() const = 0;

  virtual std::string describeUnit() = 0;
  virtual void close() = 0;
};
}  // namespace scope_lockin
