/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "capture_strategy.hpp"
#include "rtsp_camera.hpp"

namespace tapocam {

using CameraOpener = std::function<std::unique_ptr<RtspCamera>(std::string const& url, RtspOptions const& options)>;

// Percent-encodes everything except RFC 3986 unreserved characters and '/'.
std::string percent_encode(std::string const& text);

// Candidate stream locators in the order they are tried: every configured
// path with the raw credentials, then the first path with the password
// percent-encoded.
std::vector<std::string> stream_locators(DeviceEndpoint const& endpoint, StreamSettings const& settings);

// The locator with its password replaced by "***".
std::string redact_locator(std::string const& url);

struct PollOutcome {
    std::optional<cv::Mat> frame_;
    int attempts_ = 0;
    bool timed_out_ = false;
};

// Reads from an open camera until a usable (non-empty) frame arrives, at most
// `frame_attempts_` times with `attempt_delay_` between attempts, and never
// for longer than `poll_timeout_` in total. The frame is returned as an owned
// BGR matrix.
PollOutcome poll_frame(RtspCamera& camera, StreamSettings const& settings);

class StreamStrategy : public CaptureStrategy {
public:
    explicit StreamStrategy(StreamSettings settings, bool verbose = false, CameraOpener opener = {});

    char const* name() const override { return "RTSP"; }
    CaptureResult attempt(DeviceEndpoint const& endpoint, CaptureTarget const& target) override;

private:
    StreamSettings settings_;
    bool verbose_;
    CameraOpener opener_;
};

} // namespace tapocam
