/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "output_format.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>

using namespace tapocam;

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

OutputFormat tapocam::parse_output_format(std::string const& name)
{
    auto lowered = to_lower(name);
    if (lowered == "png") {
        return OutputFormat::PNG;
    }
    if (lowered == "tiff" || lowered == "tif") {
        return OutputFormat::TIFF;
    }
    if (lowered == "bmp") {
        return OutputFormat::BMP;
    }
    throw ConfigurationError("unsupported output format `" + name + "` (expected PNG, TIFF or BMP)");
}

char const* tapocam::format_name(OutputFormat format)
{
    switch (format) {
    case OutputFormat::PNG:
        return "PNG";
    case OutputFormat::TIFF:
        return "TIFF";
    case OutputFormat::BMP:
        return "BMP";
    }
    return "?";
}

std::string tapocam::format_extension(OutputFormat format)
{
    return to_lower(format_name(format));
}

template<size_t N>
static bool starts_with(uint8_t const* data, size_t size, std::array<uint8_t, N> const& magic)
{
    return size >= N && std::equal(magic.begin(), magic.end(), data);
}

std::optional<OutputFormat> tapocam::sniff_format(uint8_t const* data, size_t size)
{
    static constexpr std::array<uint8_t, 8> png_magic { 0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a };
    static constexpr std::array<uint8_t, 4> tiff_le_magic { 'I', 'I', 0x2a, 0x00 };
    static constexpr std::array<uint8_t, 4> tiff_be_magic { 'M', 'M', 0x00, 0x2a };
    static constexpr std::array<uint8_t, 2> bmp_magic { 'B', 'M' };

    if (data == nullptr) {
        return {};
    }
    if (starts_with(data, size, png_magic)) {
        return OutputFormat::PNG;
    }
    if (starts_with(data, size, tiff_le_magic) || starts_with(data, size, tiff_be_magic)) {
        return OutputFormat::TIFF;
    }
    if (starts_with(data, size, bmp_magic)) {
        return OutputFormat::BMP;
    }
    return {};
}
