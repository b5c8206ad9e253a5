/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "image.hpp"

namespace tapocam {

struct RtspOptions {
    std::chrono::milliseconds open_timeout_ { 10'000 };
    bool over_tcp_ = false;
    bool trace_ = false;
};

class RtspCamera {
public:
    // Connects to `url` and blocks until the session plays. Throws
    // ConnectionError if the server refuses or the session cannot be set up,
    // TimeoutError if that takes longer than `options.open_timeout_`.
    static std::unique_ptr<RtspCamera> open(std::string const& url, RtspOptions const& options);

    virtual ~RtspCamera() = default;

    // Waits at most `timeout` for a frame newer than the last one read and
    // returns it as BGR. Returns nothing on timeout; throws ConnectionError
    // once the stream has died. The returned view stays valid until the next
    // call.
    virtual std::optional<Image> read(std::chrono::milliseconds timeout) = 0;
};

} // namespace tapocam
