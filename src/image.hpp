/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace tapocam {

// Non-owning view of a converted frame, packed 8-bit BGR. Valid until the
// next read from the camera that produced it, or until the camera is
// destroyed.
struct Image {
    Image(uint8_t* data, size_t size, int width, int height, int stride)
        : data_(data)
        , size_(size)
        , width_(width)
        , height_(height)
        , stride_(stride)
    {
    }

    bool empty() const { return data_ == nullptr || size_ == 0 || width_ <= 0 || height_ <= 0; }

    uint8_t* data_;
    size_t size_;
    int width_;
    int height_;
    int stride_;
};

} // namespace tapocam
