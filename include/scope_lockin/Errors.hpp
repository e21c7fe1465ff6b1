/* Copyright (c) 2020, Jonas Lauener & Wingtra AG
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <stdexcept>
#include <string>

namespace scope_lockin {
// Root of all errors raised by acquisition and processing. Every one of them
// aborts the current cycle; none leaves a partial result behind.
class LockInError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A requested parameter lies outside the allowed set. Raised before any
// device command or numeric computation.
class ConfigurationError : public LockInError {
 public:
  using LockInError::LockInError;
};

class AcquisitionTimeoutError : public LockInError {
 public:
  using LockInError::LockInError;
};

// The instrument reported the "no data" sentinel for a channel.
class EmptyDataError : public LockInError {
 public:
  using LockInError::LockInError;
};

class TransportError : public LockInError {
 public:
  using LockInError::LockInError;
};

class ProcessingError : public LockInError {
 public:
  using LockInError::LockInError;
};
}  // namespace scope_lockin
