/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "http_strategy.hpp"
#include "errors.hpp"
#include "image_writer.hpp"
#include "tapo_api.hpp"

#include <exception>
#include <iostream>
#include <sstream>

using namespace tapocam;

namespace {

// The device no longer accepts the token a snapshot was requested with.
class StaleTokenError : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

} // namespace

char const* tapocam::to_string(HttpState state)
{
    switch (state) {
    case HttpState::NoToken:
        return "NoToken";
    case HttpState::Authenticating:
        return "Authenticating";
    case HttpState::Authenticated:
        return "Authenticated";
    case HttpState::SnapshotRequested:
        return "SnapshotRequested";
    case HttpState::Succeeded:
        return "Succeeded";
    case HttpState::Failed:
        return "Failed";
    }
    return "?";
}

HttpStrategy::HttpStrategy(HttpSettings settings, bool verbose, std::unique_ptr<HttpTransport> transport)
    : settings_(std::move(settings))
    , verbose_(verbose)
    , transport_(std::move(transport))
    , state_(HttpState::NoToken)
{
}

HttpTransport& HttpStrategy::transport()
{
    if (!transport_) {
        transport_ = make_curl_transport();
    }
    return *transport_;
}

void HttpStrategy::authenticate(DeviceEndpoint const& endpoint)
{
    state_ = HttpState::Authenticating;

    HttpResponse response;
    try {
        response = transport().post_json(control_url(endpoint.address_, {}),
            login_request(endpoint.username_, endpoint.password_), settings_.login_timeout_);
    } catch (std::exception const& e) {
        throw AuthenticationError(e.what());
    }

    token_ = parse_login_response(response);
    state_ = HttpState::Authenticated;
}

std::vector<uint8_t> HttpStrategy::fetch_snapshot(DeviceEndpoint const& endpoint, bool token_was_cached)
{
    state_ = HttpState::SnapshotRequested;

    auto response = transport().post_json(control_url(endpoint.address_, token_), snapshot_request(),
        settings_.snapshot_timeout_);

    if (response.status_ == 401 && token_was_cached) {
        throw StaleTokenError("HTTP API failed: 401");
    }
    if (response.status_ != 200) {
        throw ProtocolError("HTTP API failed: " + std::to_string(response.status_));
    }

    auto const& content_type = response.content_type_;
    if (content_type.find("image") != std::string::npos) {
        if (response.body_.empty()) {
            throw ProtocolError("snapshot response has an empty body");
        }
        return std::vector<uint8_t>(response.body_.begin(), response.body_.end());
    }

    if (content_type.find("application/json") != std::string::npos) {
        auto root = parse_json(response.body_);
        if (token_was_cached && response_error_code(root) == tapo_session_expired) {
            throw StaleTokenError("session token expired");
        }
        return parse_snapshot_payload(root);
    }

    throw ProtocolError("unexpected snapshot content type `" + content_type + "`");
}

CaptureResult HttpStrategy::attempt(DeviceEndpoint const& endpoint, CaptureTarget const& target)
{
    try {
        bool token_was_cached = !token_.empty();
        if (token_was_cached) {
            state_ = HttpState::Authenticated;
        } else {
            authenticate(endpoint);
        }

        std::vector<uint8_t> image;
        try {
            image = fetch_snapshot(endpoint, token_was_cached);
        } catch (StaleTokenError const& e) {
            if (!settings_.refresh_stale_token_) {
                throw ProtocolError(e.what());
            }
            if (verbose_) {
                std::cout << "Session token rejected, authenticating again..." << std::endl;
            }
            token_.clear();
            authenticate(endpoint);
            image = fetch_snapshot(endpoint, false);
        }

        auto size = write_encoded_image(image, target.path_, target.format_);
        state_ = HttpState::Succeeded;

        std::ostringstream os;
        os << "Image captured via HTTP API: " << size.width << "x" << size.height;
        return { true, os.str(), target.path_ };
    } catch (AuthenticationError const& e) {
        state_ = HttpState::Failed;
        return { false, std::string("HTTP API authentication failed: ") + e.what(), {} };
    } catch (std::exception const& e) {
        state_ = HttpState::Failed;
        return { false, std::string("HTTP capture failed: ") + e.what(), {} };
    }
}
