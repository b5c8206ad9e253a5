/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "tapo_api.hpp"
#include "errors.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <memory>

extern "C" {
#include <libavutil/base64.h>
#include <libavutil/md5.h>
}

using namespace tapocam;

std::string tapocam::base64_encode(uint8_t const* data, size_t size)
{
    std::vector<char> out(AV_BASE64_SIZE(size));
    if (av_base64_encode(out.data(), (int)out.size(), data, (int)size) == nullptr) {
        throw std::runtime_error("base64 encoding failed");
    }
    return std::string(out.data());
}

std::string tapocam::base64_encode(std::string const& text)
{
    return base64_encode(reinterpret_cast<uint8_t const*>(text.data()), text.size());
}

std::vector<uint8_t> tapocam::base64_decode(std::string const& text)
{
    std::string compact;
    compact.reserve(text.size());
    for (unsigned char c : text) {
        if (!std::isspace(c)) {
            compact += (char)c;
        }
    }

    std::vector<uint8_t> out(compact.size() / 4 * 3 + 3);
    int size = av_base64_decode(out.data(), compact.c_str(), (int)out.size());
    if (size < 0) {
        throw ProtocolError("malformed base64 payload");
    }
    out.resize((size_t)size);
    return out;
}

std::string tapocam::md5_hex(std::string const& text)
{
    std::array<uint8_t, 16> digest;
    av_md5_sum(digest.data(), reinterpret_cast<uint8_t const*>(text.data()), text.size());

    std::string hex;
    hex.reserve(digest.size() * 2);
    for (auto byte : digest) {
        char buf[3];
        std::snprintf(buf, sizeof(buf), "%02x", byte);
        hex += buf;
    }
    return hex;
}

std::string tapocam::hash_password(std::string const& password)
{
    return base64_encode(md5_hex(password));
}

std::string tapocam::control_url(std::string const& host, std::string const& token)
{
    return "http://" + host + "/stok=" + (token.empty() ? std::string("0") : token) + "/ds";
}

// Missing keys and non-object parents both yield a null value.
static Json::Value member(Json::Value const& value, char const* key)
{
    if (!value.isObject()) {
        return Json::Value();
    }
    return value.get(key, Json::Value());
}

static std::string to_json(Json::Value const& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

std::string tapocam::login_request(std::string const& username, std::string const& password)
{
    Json::Value root;
    root["method"] = "login";
    root["params"]["hashed"] = true;
    root["params"]["username"] = base64_encode(username);
    root["params"]["password"] = hash_password(password);
    return to_json(root);
}

std::string tapocam::snapshot_request()
{
    Json::Value names(Json::arrayValue);
    names.append("snapshot");

    Json::Value root;
    root["method"] = "get";
    root["params"]["image"]["name"] = names;
    return to_json(root);
}

Json::Value tapocam::parse_json(std::string const& body)
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw ProtocolError("malformed JSON response: " + errors);
    }
    if (!root.isObject()) {
        throw ProtocolError("JSON response is not an object");
    }
    return root;
}

int tapocam::response_error_code(Json::Value const& root)
{
    auto code = member(root, "error_code");
    if (!code.isInt()) {
        throw ProtocolError("response has no error_code");
    }
    return code.asInt();
}

std::string tapocam::parse_login_response(HttpResponse const& response)
{
    if (response.status_ != 200) {
        throw AuthenticationError("login failed with HTTP status " + std::to_string(response.status_));
    }

    Json::Value root;
    int code;
    try {
        root = parse_json(response.body_);
        code = response_error_code(root);
    } catch (ProtocolError const& e) {
        throw AuthenticationError(std::string("login failed: ") + e.what());
    }

    if (code != tapo_no_error) {
        throw AuthenticationError("login rejected with error_code " + std::to_string(code));
    }

    auto token = member(member(root, "result"), "stok");
    if (!token.isString() || token.asString().empty()) {
        throw AuthenticationError("login response carries no session token");
    }
    return token.asString();
}

std::vector<uint8_t> tapocam::parse_snapshot_payload(Json::Value const& root)
{
    int code = response_error_code(root);
    if (code != tapo_no_error) {
        throw ProtocolError("snapshot request failed with error_code " + std::to_string(code));
    }

    auto snapshot = member(member(member(root, "result"), "image"), "snapshot");
    if (!snapshot.isString() || snapshot.asString().empty()) {
        throw ProtocolError("snapshot response carries no image");
    }

    auto bytes = base64_decode(snapshot.asString());
    if (bytes.empty()) {
        throw ProtocolError("snapshot response carries an empty image");
    }
    return bytes;
}
