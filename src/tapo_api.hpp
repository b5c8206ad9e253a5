/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <json/json.h>

#include "http_transport.hpp"

namespace tapocam {

// Wire format of the camera's control endpoint, `POST /stok=<token>/ds` with
// a `{method, params}` JSON body. Every response carries a top-level
// `error_code`, 0 meaning success.

constexpr int tapo_no_error = 0;
// Returned when the session token is unknown or expired.
constexpr int tapo_session_expired = -40401;

std::string base64_encode(uint8_t const* data, size_t size);
std::string base64_encode(std::string const& text);

// Ignores embedded whitespace. Throws ProtocolError on malformed input.
std::vector<uint8_t> base64_decode(std::string const& text);

// Lower-case hex MD5 digest.
std::string md5_hex(std::string const& text);

// base64(md5hex(password)); the device expects exactly this for a "hashed"
// login, weak as it is.
std::string hash_password(std::string const& password);

// http://<host>/stok=<token>/ds, with "0" standing in for a missing token.
std::string control_url(std::string const& host, std::string const& token);

std::string login_request(std::string const& username, std::string const& password);
std::string snapshot_request();

// Throws ProtocolError if `body` is not a JSON object.
Json::Value parse_json(std::string const& body);

// Throws ProtocolError if the field is absent or not an integer.
int response_error_code(Json::Value const& root);

// Returns the session token. Throws AuthenticationError for a non-200 status,
// a non-JSON body, a non-zero error code or a missing token.
std::string parse_login_response(HttpResponse const& response);

// Extracts and decodes `result.image.snapshot` from a snapshot response.
// Throws ProtocolError for a non-zero error code or a missing payload.
std::vector<uint8_t> parse_snapshot_payload(Json::Value const& root);

} // namespace tapocam
