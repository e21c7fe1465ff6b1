/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <string>

#include <gtest/gtest.h>

#include "scope_lockin/Errors.hpp"
#include "scope_lockin/oscilloscope/ScpiTransport.hpp"

using namespace scope_lockin;

namespace {
std::vector<uint8_t> bytes(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}
}  // namespace

TEST(DefiniteLengthBlock, ExtractsPayload) {
  EXPECT_EQ(parseDefiniteLengthBlock(bytes("#15hello\n")), bytes("hello"));
  EXPECT_EQ(parseDefiniteLengthBlock(bytes("#9000000003abc")), bytes("abc"));
  EXPECT_EQ(parseDefiniteLengthBlock(bytes("#800000003abc\n")), bytes("abc"));
  EXPECT_TRUE(parseDefiniteLengthBlock(bytes("#10\n")).empty());
}

TEST(DefiniteLengthBlock, PayloadMayContainNewlinesAndZeros) {
  const std::vector<uint8_t> raw = {'#', '1', '4', 0, '\n', 255, 7, '\n'};
  const std::vector<uint8_t> payload = {0, '\n', 255, 7};
  EXPECT_EQ(parseDefiniteLengthBlock(raw), payload);
}

TEST(DefiniteLengthBlock, RejectsMalformedHeaders) {
  EXPECT_THROW(parseDefiniteLengthBlock(bytes("")), TransportError);
  EXPECT_THROW(parseDefiniteLengthBlock(bytes("15hello")), TransportError);
  EXPECT_THROW(parseDefiniteLengthBlock(bytes("#0hello")), TransportError);
  EXPECT_THROW(parseDefiniteLengthBlock(bytes("#x5hello")), TransportError);
  EXPECT_THROW(parseDefiniteLengthBlock(bytes("#3")), TransportError);
  EXPECT_THROW(parseDefiniteLengthBlock(bytes("#2a5hello")), TransportError);
}

TEST(DefiniteLengthBlock, RejectsTruncatedPayload) {
  EXPECT_THROW(parseDefiniteLengthBlock(bytes("#210short")), TransportError);
}

TEST(TrimReply, StripsLineEndings) {
  EXPECT_EQ(trimReply(" STOP\r\n"), "STOP");
  EXPECT_EQ(trimReply("\n"), "");
  EXPECT_EQ(trimReply("1.0e-3"), "1.0e-3");
}
