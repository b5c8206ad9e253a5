/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace tapocam {

struct HttpResponse {
    long status_ = 0;
    // Lower-cased Content-Type header value, empty if absent.
    std::string content_type_;
    std::string body_;
};

// Request/response exchange with a device's control endpoint. One transport
// belongs to one device session; implementations may keep the connection
// alive between requests.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // POSTs `body` as application/json. Throws ConnectionError when the
    // endpoint cannot be reached and TimeoutError when no complete response
    // arrives within `timeout`. Any HTTP status is returned, not thrown.
    virtual HttpResponse post_json(std::string const& url,
        std::string const& body,
        std::chrono::milliseconds timeout)
        = 0;
};

// libcurl backed transport.
std::unique_ptr<HttpTransport> make_curl_transport();

} // namespace tapocam
