/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "scope_lockin/oscilloscope/ScpiTransport.hpp"

#include <cctype>
#include <string>

#include "scope_lockin/Errors.hpp"

namespace scope_lockin {
std::vector<uint8_t> parseDefiniteLengthBlock(const std::vector<uint8_t> &raw) {
  if (raw.size() < 2 || raw[0] != '#') {
    throw TransportError("Binary block does not start with '#'");
  }
  if (!std::isdigit(raw[1]) || raw[1] == '0') {
    // "#0" announces an indefinite block, which waveform reads never use.
    throw TransportError("Binary block has no definite length header");
  }

  const std::size_t headerDigits = raw[1] - '0';
  if (raw.size() < 2 + headerDigits) {
    throw TransportError("Binary block header is truncated");
  }

  std::size_t payloadLength = 0;
  for (std::size_t i = 0; i < headerDigits; ++i) {
    const uint8_t c = raw[2 + i];
    if (!std::isdigit(c)) {
      throw TransportError("Binary block length contains a non-digit");
    }
    payloadLength = payloadLength * 10 + (c - '0');
  }

  const std::size_t payloadStart = 2 + headerDigits;
  if (raw.size() - payloadStart < payloadLength) {
    throw TransportError("Binary block announced " +
                         std::to_string(payloadLength) + " bytes but carries " +
                         std::to_string(raw.size() - payloadStart));
  }

  // Anything after the payload is the trailing newline.
  return std::vector<uint8_t>(raw.begin() + payloadStart,
                              raw.begin() + payloadStart + payloadLength);
}

std::string trimReply(const std::string &reply) {
  const auto first = reply.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = reply.find_last_not_of(" \t\r\n");
  return reply.substr(first, last - first + 1);
}
}  // namespace scope_lockin
