/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "http_transport.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <mutex>

#include <curl/curl.h>

using namespace tapocam;

namespace {

struct CurlDeleter {
    void operator()(CURL* p) const { curl_easy_cleanup(p); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* p) const { curl_slist_free_all(p); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

void ensure_curl_initialized()
{
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw ConnectionError("failed to initialize libcurl");
        }
    });
}

size_t on_body(char* data, size_t size, size_t count, void* user_data)
{
    static_cast<std::string*>(user_data)->append(data, size * count);
    return size * count;
}

class CurlTransport : public HttpTransport {
public:
    CurlTransport();
    HttpResponse post_json(std::string const& url,
        std::string const& body,
        std::chrono::milliseconds timeout) override;

private:
    CurlPtr curl_;
    // Registered with the handle for its whole lifetime.
    std::array<char, CURL_ERROR_SIZE> error_buffer_;
};

CurlTransport::CurlTransport()
    : error_buffer_ {}
{
    ensure_curl_initialized();
    curl_ = CurlPtr(curl_easy_init());
    if (!curl_) {
        throw ConnectionError("failed to create a libcurl handle");
    }
}

HttpResponse CurlTransport::post_json(std::string const& url,
    std::string const& body,
    std::chrono::milliseconds timeout)
{
    auto* curl = curl_.get();
    HttpResponse response;
    error_buffer_[0] = '\0';

    CurlSlistPtr headers(curl_slist_append(nullptr, "Content-Type: application/json"));
    if (!headers) {
        throw ConnectionError("failed to build request headers");
    }

    // The handle is reused so the connection stays alive between login and
    // snapshot; options from the previous request are reset first.
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout.count());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body_);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer_.data());

    CURLcode code = curl_easy_perform(curl);

    // `body`, `headers` and `response` do not outlive this call
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, nullptr);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, nullptr);

    if (code != CURLE_OK) {
        std::string reason = error_buffer_[0] != '\0' ? error_buffer_.data() : curl_easy_strerror(code);
        if (code == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutError("request to " + url + " timed out: " + reason);
        }
        throw ConnectionError("request to " + url + " failed: " + reason);
    }

    if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_) != CURLE_OK) {
        throw ConnectionError("no response status from " + url);
    }

    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type_ = content_type;
        std::transform(response.content_type_.begin(), response.content_type_.end(),
            response.content_type_.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    }

    return response;
}

} // namespace

std::unique_ptr<HttpTransport> tapocam::make_curl_transport()
{
    return std::make_unique<CurlTransport>();
}
