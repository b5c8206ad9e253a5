/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <chrono>
#include <iostream>
#include <memory>

#include <BasicUsageEnvironment.hh>

#include "errors.hpp"
#include "frame_exchange.hpp"
#include "rtsp_camera.hpp"
#include "rtsp_camera_client.hpp"
#include "video_scaler.hpp"

using namespace tapocam;

struct UsageEnvironmentDeleter {
    void operator()(UsageEnvironment* p) const
    {
        if (p->reclaim() == False) {
            std::cerr << "live555 usage environment not reclaimed" << std::endl;
        }
    }
};

class RtspCameraImpl : public RtspCamera {
public:
    RtspCameraImpl(std::string const& url, RtspOptions const& options);
    virtual ~RtspCameraImpl() override;
    std::optional<Image> read(std::chrono::milliseconds timeout) override;

    void wait_started(std::chrono::milliseconds timeout);

private:
    FrameExchange exchange_;
    VideoFramePtr video_frame_;
    VideoScaler video_scaler_;

    std::unique_ptr<TaskScheduler> scheduler_;
    std::unique_ptr<UsageEnvironment, UsageEnvironmentDeleter> environment_;
    RtspCameraClient::Ptr client_;
};

RtspCameraImpl::RtspCameraImpl(std::string const& url, RtspOptions const& options)
    : exchange_(make_videoframe())
    , video_frame_(make_videoframe())
    , scheduler_(BasicTaskScheduler::createNew())
    , environment_(BasicUsageEnvironment::createNew(*scheduler_))
    , client_(RtspCameraClient::create(*environment_, url, exchange_, options))
{
}

RtspCameraImpl::~RtspCameraImpl()
{
    client_->quit();
}

void RtspCameraImpl::wait_started(std::chrono::milliseconds timeout)
{
    switch (exchange_.wait_started(timeout)) {
    case StreamStatus::Playing:
        return;
    case StreamStatus::Failed:
        throw ConnectionError(exchange_.error().value_or("stream failed"));
    case StreamStatus::Connecting:
        throw TimeoutError("stream did not start within "
            + std::to_string(timeout.count()) + " ms");
    }
}

std::unique_ptr<RtspCamera> RtspCamera::open(std::string const& url, RtspOptions const& options)
{
    auto camera = std::make_unique<RtspCameraImpl>(url, options);
    camera->wait_started(options.open_timeout_);
    return camera;
}

std::optional<Image> RtspCameraImpl::read(std::chrono::milliseconds timeout)
{
    auto maybe_frame = exchange_.try_pop(std::move(video_frame_), timeout);
    if (!maybe_frame) {
        auto maybe_error = exchange_.error();
        if (maybe_error) {
            throw ConnectionError(maybe_error.value());
        }
        return {};
    }

    video_frame_ = std::move(*maybe_frame);
    return video_scaler_.convert(video_frame_.get());
}
