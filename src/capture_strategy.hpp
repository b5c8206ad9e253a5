/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <string>

#include "capture_settings.hpp"
#include "output_format.hpp"

namespace tapocam {

struct CaptureTarget {
    std::string path_;
    OutputFormat format_;
};

struct CaptureResult {
    bool success_;
    std::string message_;
    // Set on success only.
    std::string output_path_;
};

// One self-contained way of acquiring a still image. Implementations never
// throw: every failure comes back as an unsuccessful CaptureResult, and a
// failed attempt leaves nothing at the target path.
class CaptureStrategy {
public:
    virtual ~CaptureStrategy() = default;
    virtual char const* name() const = 0;
    virtual CaptureResult attempt(DeviceEndpoint const& endpoint, CaptureTarget const& target) = 0;
};

} // namespace tapocam
