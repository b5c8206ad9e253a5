/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "capture_orchestrator.hpp"
#include "errors.hpp"
#include "http_strategy.hpp"
#include "stream_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace tapocam;

CaptureMethod tapocam::parse_capture_method(std::string const& name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
        [](unsigned char c) { return (char)std::tolower(c); });

    if (lowered == "auto") {
        return CaptureMethod::Auto;
    }
    if (lowered == "rtsp" || lowered == "stream" || lowered == "stream-only") {
        return CaptureMethod::Stream;
    }
    if (lowered == "http" || lowered == "http-only") {
        return CaptureMethod::Http;
    }
    throw ConfigurationError("unsupported capture method `" + name + "` (expected auto, rtsp or http)");
}

char const* tapocam::method_name(CaptureMethod method)
{
    switch (method) {
    case CaptureMethod::Auto:
        return "auto";
    case CaptureMethod::Stream:
        return "rtsp";
    case CaptureMethod::Http:
        return "http";
    }
    return "?";
}

static long parse_bounded(std::string const& text, char const* what, long max)
{
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE || value <= 0 || value > max) {
        throw ConfigurationError(std::string("invalid ") + what + " `" + text + "` (expected 1.."
            + std::to_string(max) + ")");
    }
    return value;
}

int tapocam::parse_rtsp_port(std::string const& text)
{
    return (int)parse_bounded(text, "port", 65535);
}

std::chrono::seconds tapocam::parse_capture_interval(std::string const& text)
{
    constexpr long one_week = 7 * 24 * 60 * 60;
    return std::chrono::seconds(parse_bounded(text, "interval", one_week));
}

CaptureOrchestrator::CaptureOrchestrator(DeviceEndpoint endpoint, CaptureSettings settings)
    : CaptureOrchestrator(std::move(endpoint), std::move(settings), nullptr, nullptr)
{
}

CaptureOrchestrator::CaptureOrchestrator(DeviceEndpoint endpoint,
    CaptureSettings settings,
    std::unique_ptr<CaptureStrategy> stream_strategy,
    std::unique_ptr<CaptureStrategy> http_strategy)
    : endpoint_(std::move(endpoint))
    , settings_(std::move(settings))
    , stream_strategy_(std::move(stream_strategy))
    , http_strategy_(std::move(http_strategy))
{
    if (!stream_strategy_) {
        stream_strategy_ = std::make_unique<StreamStrategy>(settings_.stream_, settings_.verbose_);
    }
    if (!http_strategy_) {
        http_strategy_ = std::make_unique<HttpStrategy>(settings_.http_, settings_.verbose_);
    }
}

std::vector<CaptureStrategy*> CaptureOrchestrator::strategies_for(CaptureMethod method)
{
    switch (method) {
    case CaptureMethod::Auto:
        return { stream_strategy_.get(), http_strategy_.get() };
    case CaptureMethod::Stream:
        return { stream_strategy_.get() };
    case CaptureMethod::Http:
        return { http_strategy_.get() };
    }
    return {};
}

CaptureResult CaptureOrchestrator::capture(std::string const& output_path,
    OutputFormat format,
    CaptureMethod method)
{
    if (output_path.empty()) {
        throw ConfigurationError("no output path given");
    }

    CaptureTarget target { output_path, format };
    CaptureResult result { false, "no capture strategy selected", {} };

    for (auto* strategy : strategies_for(method)) {
        if (settings_.verbose_) {
            std::cout << "\nTrying " << strategy->name() << " method..." << std::endl;
        }

        result = strategy->attempt(endpoint_, target);
        if (result.success_) {
            result.output_path_ = output_path;
            if (settings_.verbose_) {
                std::cout << "✓ " << result.message_ << std::endl;
            }
            return result;
        }

        if (settings_.verbose_) {
            std::cout << strategy->name() << " method failed: " << result.message_ << std::endl;
        }
    }

    return result;
}

CaptureResult CaptureOrchestrator::capture(std::string const& output_path,
    std::string const& format,
    std::string const& method)
{
    return capture(output_path, parse_output_format(format), parse_capture_method(method));
}

std::string tapocam::default_output_path(std::string const& address, OutputFormat format)
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local {};
    localtime_r(&now, &local);

    std::ostringstream os;
    os << "tapo_capture_" << address << "_" << std::put_time(&local, "%Y%m%d_%H%M%S") << "."
       << format_extension(format);
    return os.str();
}
