/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "capture_settings.hpp"
#include "capture_strategy.hpp"
#include "output_format.hpp"

namespace tapocam {

enum class CaptureMethod {
    Auto,   // stream first, then HTTP
    Stream, // stream only
    Http,   // HTTP only
};

// Accepts "auto", "rtsp"/"stream"/"stream-only" and "http"/"http-only" in
// any letter case.
// Throws ConfigurationError for anything else.
CaptureMethod parse_capture_method(std::string const& name);

char const* method_name(CaptureMethod method);

// Command line numbers. Both throw ConfigurationError unless `text` is a
// whole decimal number in range: 1..65535 for a port, 1 s..7 days for the
// continuous capture interval.
int parse_rtsp_port(std::string const& text);
std::chrono::seconds parse_capture_interval(std::string const& text);

// Obtains one still image from a camera by running the capture strategies
// the method selects, in priority order, until one succeeds.
//
// An instance belongs to one device and one account: the HTTP session token
// it caches must not be used against anything else. Instances are not
// thread safe; capture from several devices with one orchestrator each.
class CaptureOrchestrator {
public:
    explicit CaptureOrchestrator(DeviceEndpoint endpoint, CaptureSettings settings = {});

    // For callers supplying their own strategies (tests, alternative
    // transports). Either may be null, in which case the default is built.
    CaptureOrchestrator(DeviceEndpoint endpoint,
        CaptureSettings settings,
        std::unique_ptr<CaptureStrategy> stream_strategy,
        std::unique_ptr<CaptureStrategy> http_strategy);

    // Returns the first successful strategy's result, or the last failure.
    // Never throws for capture failures.
    CaptureResult capture(std::string const& output_path, OutputFormat format, CaptureMethod method);

    // As above with textual format and method. Throws ConfigurationError for
    // unsupported values before any network activity.
    CaptureResult capture(std::string const& output_path,
        std::string const& format,
        std::string const& method);

    DeviceEndpoint const& endpoint() const { return endpoint_; }

private:
    std::vector<CaptureStrategy*> strategies_for(CaptureMethod method);

    DeviceEndpoint endpoint_;
    CaptureSettings settings_;
    std::unique_ptr<CaptureStrategy> stream_strategy_;
    std::unique_ptr<CaptureStrategy> http_strategy_;
};

// tapo_capture_<address>_<YYYYmmdd_HHMMSS>.<ext> for the current local time.
std::string default_output_path(std::string const& address, OutputFormat format);

} // namespace tapocam
