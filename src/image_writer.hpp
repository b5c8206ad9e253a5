/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "output_format.hpp"

namespace tapocam {

// Decodes any format OpenCV understands (JPEG, PNG, ...). Channels and depth
// are kept as stored. Throws EncodingError if the data is not an image.
cv::Mat decode_image(uint8_t const* data, size_t size);

// Encodes a BGR(A) or grayscale image. Throws EncodingError.
std::vector<uint8_t> encode_image(cv::Mat const& image, OutputFormat format);

// Encodes `image` and writes it to `path`. The file either appears complete
// or not at all. Throws EncodingError or OutputError.
void write_image(cv::Mat const& image, std::string const& path, OutputFormat format);

// Writes already encoded image data (as received from a device) to `path` in
// `format`. Data that already is in `format` is written unchanged once it has
// been verified to decode; anything else is decoded and re-encoded.
// Returns the pixel dimensions of the image.
cv::Size write_encoded_image(std::vector<uint8_t> const& data, std::string const& path,
    OutputFormat format);

} // namespace tapocam
