/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include "av_handles.hpp"
#include "image.hpp"

namespace tapocam {

// Converts decoded frames (usually planar YUV) to packed BGR at the source
// resolution. Re-initializes itself when the source geometry changes.
class VideoScaler {
public:
    VideoScaler();

    Image convert(AVFrame const* src_frame);

private:
    void initialize(int width, int height, AVPixelFormat src_pixfmt);

    SwsContextPtr sws_context_;
    VideoFramePtr dst_frame_;
    int src_width_;
    int src_height_;
    AVPixelFormat src_pixfmt_;
};

} // namespace tapocam
