/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/oscilloscope/AcquisitionProtocol.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

#include "loguru/loguru.hpp"
#include "scope_lockin/Errors.hpp"
#include "scope_lockin/oscilloscope/Polling.hpp"

namespace scope_lockin {
namespace {
// The oscilloscope's horizontal axis spans 12 divisions.
constexpr double kHorizontalDivisions = 12.0;

std::string channelSource(Channel channel) {
  return "CHANnel" + std::to_string(channelNumber(channel));
}

// Puts the state back to IDLE when a cycle leaves early.
class IdleOnExit {
 public:
  explicit IdleOnExit(AcquisitionProtocol::State &state) : state(state) {}
  ~IdleOnExit() { state = AcquisitionProtocol::State::IDLE; }

 private:
  AcquisitionProtocol::State &state;
};
}  // namespace

std::string toString(AcquisitionProtocol::State state) {
  switch (state) {
    case AcquisitionProtocol::State::IDLE:
      return "IDLE";
    case AcquisitionProtocol::State::ARMED:
      return "ARMED";
    case AcquisitionProtocol::State::WAITING_FOR_TRIGGER:
      return "WAITING_FOR_TRIGGER";
    case AcquisitionProtocol::State::STOPPED:
      return "STOPPED";
    case AcquisitionProtocol::State::READING:
      return "READING";
  }
  return "UNKNOWN";
}

AcquisitionProtocol::AcquisitionProtocol(
    std::unique_ptr<ScpiTransport> transport, LogContext log,
    AcquisitionTiming timing)
    : transport(std::move(transport)), log(std::move(log)), timing(timing) {
  if (this->timing.maxPointsPerRead == 0) {
    throw ConfigurationError("maxPointsPerRead must be at least 1");
  }
}

AcquisitionProtocol::~AcquisitionProtocol() {
  try {
    close();
  } catch (const std::exception &e) {
    LOG_S(ERROR) << log.name << ": closing the instrument failed: " << e.what();
  }
}

void AcquisitionProtocol::close() {
  if (!transport) {
    return;
  }
  // Drop ownership first so a failing close is not retried.
  auto closing = std::move(transport);
  closing->close();
  LOG_S(INFO) << log.name << ": instrument connection closed";
}

ScpiTransport &AcquisitionProtocol::requireTransport() {
  if (!transport) {
    throw TransportError(log.name + ": instrument connection is closed");
  }
  return *transport;
}

std::string AcquisitionProtocol::identify() {
  return trimReply(requireTransport().query("*IDN?"));
}

void AcquisitionProtocol::settle() const {
  if (timing.setupSettleTime.count() > 0) {
    std::this_thread::sleep_for(timing.setupSettleTime);
  }
}

double AcquisitionProtocol::queryDouble(const std::string &command) {
  const auto reply = trimReply(requireTransport().query(command));
  try {
    std::size_t consumed = 0;
    const double value = std::stod(reply, &consumed);
    if (consumed == reply.size()) {
      return value;
    }
  } catch (const std::logic_error &) {
    // reported below
  }
  throw TransportError("Malformed reply to " + command + ": '" + reply + "'");
}

unsigned long long AcquisitionProtocol::queryUnsigned(
    const std::string &command) {
  const auto reply = trimReply(requireTransport().query(command));
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(reply, &consumed);
    if (consumed == reply.size() && reply.front() != '-') {
      return value;
    }
  } catch (const std::logic_error &) {
    // reported below
  }
  throw TransportError("Malformed reply to " + command + ": '" + reply + "'");
}

void AcquisitionProtocol::setupCapture(
    std::size_t memoryDepth, double sampleRateHz,
    const std::map<Channel, double> &channelRangesVolts,
    Channel referenceChannel, Channel acquisitionChannel) {
  auto &scope = requireTransport();

  scope.sendCommand(":RUN");
  settle();

  for (const auto channel : allChannels) {
    const bool used =
        channel == referenceChannel || channel == acquisitionChannel;
    scope.sendCommand(":" + channelSource(channel) + ":DISPlay " +
                      (used ? "ON" : "OFF"));
  }
  for (const auto &entry : channelRangesVolts) {
    std::ostringstream command;
    command << ":" << channelSource(entry.first) << ":RANGe " << entry.second;
    scope.sendCommand(command.str());
  }

  scope.sendCommand(":ACQuire:MDEPth " + std::to_string(memoryDepth));
  settle();
  if (sampleRateHz > 0.0) {
    std::ostringstream command;
    command << ":TIMebase:MAIN:SCALe "
            << static_cast<double>(memoryDepth) /
                   (sampleRateHz * kHorizontalDivisions);
    scope.sendCommand(command.str());
    settle();
  }
  scope.sendCommand(":WAVeform:FORMat BYTE");
  settle();
  scope.sendCommand(":WAVeform:MODE RAW");
  settle();
  scope.sendCommand(":TRIGger:SWEep SINGle");
  settle();

  const auto reportedDepth = queryUnsigned(":ACQuire:MDEPth?");
  if (reportedDepth != memoryDepth) {
    throw TransportError("Instrument reports memory depth " +
                         std::to_string(reportedDepth) + ", requested " +
                         std::to_string(memoryDepth));
  }

  LOG_S(INFO) << log.name << ": capture set up, " << memoryDepth
              << " points, reference " << Enum::toString(referenceChannel)
              << ", acquisition " << Enum::toString(acquisitionChannel);
}

AcquisitionData AcquisitionProtocol::acquire(Channel referenceChannel,
                                             Channel acquisitionChannel) {
  IdleOnExit idleOnExit(currentState);

  arm();
  waitForTrigger();

  currentState = State::READING;
  AcquisitionData data;
  data.refWaveform = readWaveform(referenceChannel);
  data.acquisitionWaveform = readWaveform(acquisitionChannel);
  if (data.refWaveform.size() != data.acquisitionWaveform.size()) {
    throw TransportError("Channel lengths differ: " +
                         std::to_string(data.refWaveform.size()) + " vs " +
                         std::to_string(data.acquisitionWaveform.size()));
  }

  data.timeIncrement = queryDouble(":WAVeform:XINCrement?");
  data.timeOrigin = queryDouble(":WAVeform:XORigin?");
  if (!(data.timeIncrement > 0.0)) {
    throw TransportError("Instrument reports a non-positive time increment");
  }

  LOG_S(INFO) << log.name << ": got "
              << data.timeIncrement * data.refWaveform.size()
              << " s of data";
  return data;
}

void AcquisitionProtocol::arm() {
  auto &scope = requireTransport();
  currentState = State::ARMED;
  scope.sendCommand(":RUN");
  scope.sendCommand(":TRIGger:SWEep SINGle");
  scope.sendCommand(":TFORce");
}

void AcquisitionProtocol::waitForTrigger() {
  currentState = State::WAITING_FOR_TRIGGER;
  pollUntil(
      [this]() {
        const auto status = trimReply(requireTransport().query(":TRIGger:STATus?"));
        VLOG_S(log.traceVerbosity) << log.name << ": :TRIGger:STATus? = " << status;
        if (status == "STOP") {
          return true;
        }
        if (status == "WAIT") {
          requireTransport().sendCommand(":TFORce");
        }
        return false;
      },
      timing.pollInterval, timing.maxTriggerWait, log.name + " trigger");
  currentState = State::STOPPED;
}

std::vector<float> AcquisitionProtocol::readWaveform(Channel channel) {
  auto &scope = requireTransport();
  VLOG_S(log.traceVerbosity) << log.name << ": reading " << Enum::toString(channel);

  scope.sendCommand(":STOP");
  const auto totalPoints = queryUnsigned(":ACQuire:MDEPth?");
  if (totalPoints == 0) {
    throw EmptyDataError("Empty data on " + Enum::toString(channel) +
                         ": instrument reports a memory depth of 0");
  }
  scope.sendCommand(":WAVeform:SOURce " + channelSource(channel));

  const double increment = queryDouble(":WAVeform:YINCrement?");
  const double origin = queryDouble(":WAVeform:YORigin?");
  const auto reference = queryUnsigned(":WAVeform:YREFerence?");
  VLOG_S(log.traceVerbosity) << log.name << ": increment=" << increment
                             << " origin=" << origin
                             << " reference=" << reference;
  if (reference == kNoDataReference) {
    throw EmptyDataError("Empty data on " + Enum::toString(channel) +
                         ": no capture in instrument memory");
  }

  const std::size_t batchSize = timing.maxPointsPerRead;
  const std::size_t batches = (totalPoints + batchSize - 1) / batchSize;

  std::vector<float> voltages;
  voltages.reserve(totalPoints);
  for (std::size_t batch = 0; batch < batches; ++batch) {
    // Inclusive, one-based sample indices.
    const std::size_t start = batch * batchSize + 1;
    const std::size_t stop =
        std::min<std::size_t>((batch + 1) * batchSize, totalPoints);

    scope.sendCommand(":WAVeform:STARt " + std::to_string(start));
    scope.sendCommand(":WAVeform:STOP " + std::to_string(stop));
    const auto raw = scope.queryBinaryBlock(":WAVeform:DATA?");

    const std::size_t expected = stop - start + 1;
    if (raw.size() != expected) {
      throw TransportError("Short read on " + Enum::toString(channel) +
                           ": requested " + std::to_string(expected) +
                           " points, got " + std::to_string(raw.size()));
    }
    for (const auto code : raw) {
      voltages.push_back(static_cast<float>(
          (static_cast<double>(code) - static_cast<double>(reference)) *
              increment -
          origin));
    }
    VLOG_S(log.traceVerbosity + 1) << log.name << ": batch " << batch + 1 << "/"
                                   << batches << " done";
  }
  return voltages;
}
}  // namespace scope_lockin
