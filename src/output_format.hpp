/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace tapocam {

// Lossless encodings an artifact may be written in.
enum class OutputFormat {
    PNG,
    TIFF,
    BMP,
};

// Accepts "png", "tiff", "tif" and "bmp" in any letter case.
// Throws ConfigurationError for anything else.
OutputFormat parse_output_format(std::string const& name);

char const* format_name(OutputFormat format);

// Lower-case extension without the dot, e.g. "png".
std::string format_extension(OutputFormat format);

// Identifies PNG, TIFF and BMP data by signature. Other data (JPEG included)
// yields an empty optional.
std::optional<OutputFormat> sniff_format(uint8_t const* data, size_t size);

} // namespace tapocam
