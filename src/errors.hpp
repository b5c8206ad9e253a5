/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <stdexcept>
#include <string>

namespace tapocam {

class CaptureError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unsupported format or method. Raised before any network activity.
class ConfigurationError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

// Stream or HTTP endpoint unreachable or refused.
class ConnectionError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

// HTTP login rejected or malformed.
class AuthenticationError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

// Unexpected response shape, content kind or missing payload.
class ProtocolError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

class TimeoutError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

// Image data could not be decoded or encoded into the requested format.
class EncodingError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

// The encoded image could not be persisted at the target path.
class OutputError : public CaptureError {
public:
    using CaptureError::CaptureError;
};

} // namespace tapocam
