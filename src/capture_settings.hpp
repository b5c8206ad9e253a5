/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace tapocam {

struct DeviceEndpoint {
    std::string address_;
    std::string username_;
    std::string password_;
};

struct StreamSettings {
    int rtsp_port_ = 554;
    // Tried in order; the first path is also tried once more with the
    // password percent-encoded.
    std::vector<std::string> stream_paths_ { "stream1", "stream2" };
    std::chrono::milliseconds open_timeout_ { 10'000 };
    int frame_attempts_ = 10;
    std::chrono::milliseconds attempt_delay_ { 200 };
    // Bounds frame polling regardless of frame_attempts_.
    std::chrono::milliseconds poll_timeout_ { 15'000 };
    bool over_tcp_ = false;
    bool trace_rtsp_ = false;
};

struct HttpSettings {
    std::chrono::milliseconds login_timeout_ { 10'000 };
    std::chrono::milliseconds snapshot_timeout_ { 15'000 };
    // Re-authenticate once when a cached token is rejected as expired.
    bool refresh_stale_token_ = false;
};

struct CaptureSettings {
    StreamSettings stream_;
    HttpSettings http_;
    bool verbose_ = false;
};

} // namespace tapocam
