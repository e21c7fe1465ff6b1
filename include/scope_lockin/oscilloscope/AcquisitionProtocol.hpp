/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "scope_lockin/LogContext.hpp"
#include "scope_lockin/entities/AcquisitionData.hpp"
#include "scope_lockin/entities/Channel.hpp"
#include "scope_lockin/oscilloscope/ScpiTransport.hpp"

namespace scope_lockin {
struct AcquisitionTiming {
  std::chrono::milliseconds pollInterval{100};
  std::chrono::milliseconds maxTriggerWait{10000};
  std::size_t maxPointsPerRead = 125000;
  std::chrono::milliseconds setupSettleTime{100};
};

// Reference code the instrument reports when its memory holds no capture.
constexpr unsigned long long kNoDataReference = 4294967295ULL;

// Single-sweep capture against a SCPI digitizer: arm, wait for the trigger,
// then read both channels back in bounded batches. Owns the transport.
class AcquisitionProtocol {
 public:
  enum class State {
    IDLE,
    ARMED,
    WAITING_FOR_TRIGGER,
    STOPPED,
    READING
  };

  AcquisitionProtocol(std::unique_ptr<ScpiTransport> transport,
                      LogContext log, AcquisitionTiming timing = {});
  ~AcquisitionProtocol();

  AcquisitionProtocol(const AcquisitionProtocol &) = delete;
  AcquisitionProtocol &operator=(const AcquisitionProtocol &) = delete;

  // Enables the two channels in use, disables the rest and prepares memory
  // depth, waveform format and single sweep. Arguments are assumed valid.
  void setupCapture(std::size_t memoryDepth, double sampleRateHz,
                    const std::map<Channel, double> &channelRangesVolts,
                    Channel referenceChannel, Channel acquisitionChannel);

  AcquisitionData acquire(Channel referenceChannel, Channel acquisitionChannel);

  std::string identify();

  void close();

  State state() const { return currentState; }

 private:
  void arm();
  void waitForTrigger();
  std::vector<float> readWaveform(Channel channel);

  double queryDouble(const std::string &command);
  unsigned long long queryUnsigned(const std::string &command);
  void settle() const;
  ScpiTransport &requireTransport();

  std::unique_ptr<ScpiTransport> transport;
  LogContext log;
  AcquisitionTiming timing;
  State currentState = State::IDLE;
};

std::string toString(AcquisitionProtocol::State state);
}  // namespace scope_lockin
