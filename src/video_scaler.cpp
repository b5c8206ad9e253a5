/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "video_scaler.hpp"

#include <stdexcept>
#include <tuple>
#include <utility>

using namespace tapocam;

static std::pair<AVPixelFormat, bool> full_range_equivalent(AVPixelFormat pixfmt);

VideoScaler::VideoScaler()
    : src_width_(0)
    , src_height_(0)
    , src_pixfmt_(AV_PIX_FMT_NONE)
{
}

void VideoScaler::initialize(int width, int height, AVPixelFormat src_pixfmt)
{
    AVPixelFormat dst_pixfmt = AV_PIX_FMT_BGR24;

    AVPixelFormat sws_src_pixfmt;
    bool full_range;
    std::tie(sws_src_pixfmt, full_range) = full_range_equivalent(src_pixfmt);

    sws_context_ = SwsContextPtr(sws_getContext(width, height, sws_src_pixfmt, width, height,
        dst_pixfmt, SWS_BILINEAR, nullptr, nullptr, nullptr));
    if (!sws_context_) {
        throw std::runtime_error("Failed to initialize video scaler");
    }

    if (full_range) {
        // The yuvj* formats are deprecated in swscale; feed the plain yuv
        // format and mark the source range as full (jpeg) instead.
        int* inv_table;
        int* table;
        int src_range;
        int dst_range;
        int brightness;
        int contrast;
        int saturation;

        if (sws_getColorspaceDetails(sws_context_.get(), &inv_table, &src_range, &table,
                &dst_range, &brightness, &contrast, &saturation)
            < 0) {
            throw std::runtime_error("Failed to get colorspace details");
        }

        src_range = 1;

        if (sws_setColorspaceDetails(sws_context_.get(), inv_table, src_range, table, dst_range,
                brightness, contrast, saturation)
            < 0) {
            throw std::runtime_error("Failed to set colorspace details");
        }
    }

    dst_frame_ = make_videoframe();
    if (!dst_frame_) {
        throw std::runtime_error("Failed to allocate frame");
    }
    auto* dst_frame = dst_frame_.get();
    dst_frame->format = dst_pixfmt;
    dst_frame->width = width;
    dst_frame->height = height;
    if (av_frame_get_buffer(dst_frame, 0) != 0) {
        throw std::runtime_error("Failed to allocate buffer for frame");
    }

    src_width_ = width;
    src_height_ = height;
    src_pixfmt_ = src_pixfmt;
}

Image VideoScaler::convert(AVFrame const* src_frame)
{
    if (src_frame == nullptr || src_frame->width <= 0 || src_frame->height <= 0) {
        throw std::runtime_error("Empty video frame");
    }

    auto src_pixfmt = (AVPixelFormat)src_frame->format;
    if (!sws_context_ || src_frame->width != src_width_ || src_frame->height != src_height_
        || src_pixfmt != src_pixfmt_) {
        initialize(src_frame->width, src_frame->height, src_pixfmt);
    }

    auto* dst_frame = dst_frame_.get();

    if (sws_scale(sws_context_.get(), src_frame->data, src_frame->linesize, 0, src_frame->height,
            dst_frame->data, dst_frame->linesize)
        != dst_frame->height) {
        throw std::runtime_error("Failed to scale video frame");
    }

    return Image(dst_frame->data[0], (size_t)dst_frame->linesize[0] * dst_frame->height,
        dst_frame->width, dst_frame->height, dst_frame->linesize[0]);
}

static std::pair<AVPixelFormat, bool> full_range_equivalent(AVPixelFormat pixfmt)
{
    switch (pixfmt) {
    case AV_PIX_FMT_YUVJ420P:
        return { AV_PIX_FMT_YUV420P, true };
    case AV_PIX_FMT_YUVJ422P:
        return { AV_PIX_FMT_YUV422P, true };
    case AV_PIX_FMT_YUVJ444P:
        return { AV_PIX_FMT_YUV444P, true };
    case AV_PIX_FMT_YUVJ440P:
        return { AV_PIX_FMT_YUV440P, true };
    default:
        return { pixfmt, false };
    }
}
