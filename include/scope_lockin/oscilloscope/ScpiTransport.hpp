/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace scope_lockin {
// Raw text/binary channel to a SCPI instrument (USBTMC, VISA, LXI ...).
// Implementations report failures as TransportError.
class ScpiTransport {
 public:
  virtual ~ScpiTransport() = default;

  virtual void sendCommand(const std::string &command) = 0;

  virtual std::string query(const std::string &command) = 0;

  // Sends the query and returns the payload of the IEEE-488.2 definite
  // length block the instrument answers with.
  virtual std::vector<uint8_t> queryBinaryBlock(const std::string &command) = 0;

  virtual void close() = 0;
};

// Decodes "#<d><length><payload>[\n]". Throws TransportError on a malformed
// header or a payload shorter than announced.
std::vector<uint8_t> parseDefiniteLengthBlock(const std::vector<uint8_t> &raw);

std::string trimReply(const std::string &reply);
}  // namespace scope_lockin
