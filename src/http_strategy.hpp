/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "capture_strategy.hpp"
#include "http_transport.hpp"

namespace tapocam {

// NoToken -> Authenticating -> Authenticated -> SnapshotRequested ->
// {Succeeded, Failed}. With a cached token a later attempt starts at
// Authenticated.
enum class HttpState {
    NoToken,
    Authenticating,
    Authenticated,
    SnapshotRequested,
    Succeeded,
    Failed,
};

char const* to_string(HttpState state);

// Logs in to the camera's control endpoint (once per instance, the token is
// cached and never refreshed unless `refresh_stale_token_` is set) and asks
// it for a snapshot, which may come back either as a raw image body or as a
// base64 payload inside JSON.
class HttpStrategy : public CaptureStrategy {
public:
    // Without a transport, a libcurl one is created on first use.
    explicit HttpStrategy(HttpSettings settings,
        bool verbose = false,
        std::unique_ptr<HttpTransport> transport = {});

    char const* name() const override { return "HTTP API"; }
    CaptureResult attempt(DeviceEndpoint const& endpoint, CaptureTarget const& target) override;

    HttpState state() const { return state_; }
    std::string const& token() const { return token_; }

private:
    void authenticate(DeviceEndpoint const& endpoint);
    std::vector<uint8_t> fetch_snapshot(DeviceEndpoint const& endpoint, bool token_was_cached);
    HttpTransport& transport();

    HttpSettings settings_;
    bool verbose_;
    std::unique_ptr<HttpTransport> transport_;
    std::string token_;
    HttpState state_;
};

} // namespace tapocam
