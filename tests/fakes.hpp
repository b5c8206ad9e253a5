/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "capture_strategy.hpp"
#include "errors.hpp"
#include "http_transport.hpp"
#include "rtsp_camera.hpp"

namespace tapocam::testing {

// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir()
    {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("tapocam-test-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string file(std::string const& name) const { return (path_ / name).string(); }
    std::filesystem::path const& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Deterministic colour gradient.
inline cv::Mat make_test_image(int width, int height)
{
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b((uint8_t)(x * 255 / std::max(1, width - 1)),
                (uint8_t)(y * 255 / std::max(1, height - 1)), (uint8_t)((x + y) % 256));
        }
    }
    return image;
}

inline std::string encode_jpeg(cv::Mat const& image)
{
    std::vector<uint8_t> buffer;
    cv::imencode(".jpg", image, buffer);
    return std::string(buffer.begin(), buffer.end());
}

struct RecordedRequest {
    std::string url_;
    std::string body_;
    std::chrono::milliseconds timeout_;
};

// Answers requests from a script of responses (or thrown errors), in order,
// and records what was sent.
class FakeTransport : public HttpTransport {
public:
    using Reply = std::function<HttpResponse()>;

    struct Log {
        std::vector<RecordedRequest> requests_;
    };

    FakeTransport(std::shared_ptr<Log> log)
        : log_(std::move(log))
    {
    }

    FakeTransport& reply(HttpResponse response)
    {
        replies_.push_back([response] { return response; });
        return *this;
    }

    FakeTransport& reply(Reply reply)
    {
        replies_.push_back(std::move(reply));
        return *this;
    }

    HttpResponse post_json(std::string const& url,
        std::string const& body,
        std::chrono::milliseconds timeout) override
    {
        log_->requests_.push_back({ url, body, timeout });
        if (replies_.empty()) {
            throw ConnectionError("connection refused");
        }
        auto next = std::move(replies_.front());
        replies_.pop_front();
        return next();
    }

private:
    std::shared_ptr<Log> log_;
    std::deque<Reply> replies_;
};

inline HttpResponse json_response(std::string const& body, long status = 200)
{
    return { status, "application/json; charset=utf-8", body };
}

inline HttpResponse login_ok(std::string const& token)
{
    return json_response(R"({"error_code":0,"result":{"stok":")" + token + R"(","user_group":"root"}})");
}

// Camera that delivers `frame` after `empty_reads` empty reads, each read
// returning immediately.
class FakeCamera : public RtspCamera {
public:
    FakeCamera(std::optional<cv::Mat> frame, int empty_reads, std::shared_ptr<std::atomic<int>> reads)
        : frame_(std::move(frame))
        , empty_reads_(empty_reads)
        , reads_(std::move(reads))
    {
    }

    std::optional<Image> read(std::chrono::milliseconds) override
    {
        int n = ++*reads_;
        if (!frame_ || n <= empty_reads_) {
            return {};
        }
        return Image(frame_->data, frame_->total() * frame_->elemSize(), frame_->cols, frame_->rows,
            (int)frame_->step[0]);
    }

private:
    std::optional<cv::Mat> frame_;
    int empty_reads_;
    std::shared_ptr<std::atomic<int>> reads_;
};

// Strategy returning a fixed result and counting its invocations.
class ScriptedStrategy : public CaptureStrategy {
public:
    ScriptedStrategy(char const* name, bool succeed, std::shared_ptr<int> calls)
        : name_(name)
        , succeed_(succeed)
        , calls_(std::move(calls))
    {
    }

    char const* name() const override { return name_; }

    CaptureResult attempt(DeviceEndpoint const&, CaptureTarget const& target) override
    {
        ++*calls_;
        if (succeed_) {
            return { true, std::string(name_) + " ok", target.path_ };
        }
        return { false, std::string(name_) + " failed", {} };
    }

private:
    char const* name_;
    bool succeed_;
    std::shared_ptr<int> calls_;
};

} // namespace tapocam::testing
