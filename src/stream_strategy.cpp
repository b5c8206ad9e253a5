/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "stream_strategy.hpp"
#include "errors.hpp"
#include "image_writer.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <exception>
#include <iostream>
#include <sstream>
#include <thread>

using namespace tapocam;

using Clock = std::chrono::steady_clock;

std::string tapocam::percent_encode(std::string const& text)
{
    std::string encoded;
    encoded.reserve(text.size());

    for (unsigned char c : text) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '.' || c == '_' || c == '~' || c == '/';
        if (unreserved) {
            encoded += (char)c;
        } else {
            char hex[4];
            std::snprintf(hex, sizeof(hex), "%%%02X", c);
            encoded += hex;
        }
    }

    return encoded;
}

static std::string make_locator(DeviceEndpoint const& endpoint,
    std::string const& password,
    int port,
    std::string const& path)
{
    std::ostringstream os;
    os << "rtsp://" << endpoint.username_ << ":" << password << "@" << endpoint.address_ << ":"
       << port << "/" << path;
    return os.str();
}

std::vector<std::string> tapocam::stream_locators(DeviceEndpoint const& endpoint,
    StreamSettings const& settings)
{
    std::vector<std::string> locators;
    for (auto const& path : settings.stream_paths_) {
        locators.push_back(make_locator(endpoint, endpoint.password_, settings.rtsp_port_, path));
    }
    if (!settings.stream_paths_.empty()) {
        locators.push_back(make_locator(endpoint, percent_encode(endpoint.password_),
            settings.rtsp_port_, settings.stream_paths_.front()));
    }
    return locators;
}

std::string tapocam::redact_locator(std::string const& url)
{
    auto scheme_end = url.find("://");
    auto authority_begin = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    auto at = url.rfind('@');
    if (at == std::string::npos || at < authority_begin) {
        return url;
    }
    auto colon = url.find(':', authority_begin);
    if (colon == std::string::npos || colon > at) {
        return url;
    }
    return url.substr(0, colon + 1) + "***" + url.substr(at);
}

PollOutcome tapocam::poll_frame(RtspCamera& camera, StreamSettings const& settings)
{
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;

    PollOutcome outcome;
    auto const deadline = Clock::now() + settings.poll_timeout_;

    for (int attempt = 1; attempt <= settings.frame_attempts_; attempt++) {
        auto now = Clock::now();
        if (now >= deadline) {
            outcome.timed_out_ = true;
            break;
        }

        outcome.attempts_ = attempt;
        auto image = camera.read(duration_cast<milliseconds>(deadline - now));
        if (image && !image->empty()) {
            cv::Mat view(image->height_, image->width_, CV_8UC3, image->data_, (size_t)image->stride_);
            outcome.frame_ = view.clone();
            break;
        }

        now = Clock::now();
        if (now >= deadline) {
            outcome.timed_out_ = true;
            break;
        }
        std::this_thread::sleep_for(std::min<Clock::duration>(settings.attempt_delay_, deadline - now));
    }

    return outcome;
}

StreamStrategy::StreamStrategy(StreamSettings settings, bool verbose, CameraOpener opener)
    : settings_(std::move(settings))
    , verbose_(verbose)
    , opener_(opener ? std::move(opener) : CameraOpener(&RtspCamera::open))
{
}

CaptureResult StreamStrategy::attempt(DeviceEndpoint const& endpoint, CaptureTarget const& target)
{
    RtspOptions options;
    options.open_timeout_ = settings_.open_timeout_;
    options.over_tcp_ = settings_.over_tcp_;
    options.trace_ = settings_.trace_rtsp_;

    std::string last_error = "no stream locator configured";

    for (auto const& url : stream_locators(endpoint, settings_)) {
        if (verbose_) {
            std::cout << "Trying RTSP URL: " << redact_locator(url) << std::endl;
        }

        PollOutcome outcome;
        try {
            auto camera = opener_(url, options);
            if (!camera) {
                throw ConnectionError("no camera returned");
            }
            if (verbose_) {
                std::cout << "RTSP connection established..." << std::endl;
            }
            outcome = poll_frame(*camera, settings_);
            // the stream is closed here, before anything is written
        } catch (std::exception const& e) {
            last_error = e.what();
            if (verbose_) {
                std::cout << "Failed to open RTSP connection: " << last_error << std::endl;
            }
            continue;
        }

        if (!outcome.frame_) {
            last_error = outcome.timed_out_ ? "timeout reached while reading frames"
                                            : "no valid frame after " + std::to_string(outcome.attempts_) + " attempts";
            if (verbose_) {
                std::cout << "Failed to capture valid frame: " << last_error << std::endl;
            }
            continue;
        }

        auto const& frame = *outcome.frame_;
        if (verbose_) {
            std::cout << "Successfully captured frame (attempt " << outcome.attempts_ << ")" << std::endl;
        }

        try {
            write_image(frame, target.path_, target.format_);
        } catch (std::exception const& e) {
            return { false, std::string("Failed to save RTSP frame: ") + e.what(), {} };
        }

        std::ostringstream os;
        os << "Image captured via RTSP: " << frame.cols << "x" << frame.rows;
        return { true, os.str(), target.path_ };
    }

    return { false, "Failed to capture via RTSP: " + last_error, {} };
}
