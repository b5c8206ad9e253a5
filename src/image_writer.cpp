/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include "image_writer.hpp"
#include "errors.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include <opencv2/imgcodecs.hpp>

using namespace tapocam;

namespace fs = std::filesystem;

static void write_file(std::string const& path, uint8_t const* data, size_t size)
{
    auto tmp_path = path + ".part";

    {
        std::ofstream os(tmp_path, std::ios::binary | std::ios::trunc);
        if (!os) {
            throw OutputError("failed to open `" + tmp_path + "` for writing");
        }
        os.write(reinterpret_cast<char const*>(data), (std::streamsize)size);
        os.close();
        if (!os) {
            std::error_code ec;
            fs::remove(tmp_path, ec);
            throw OutputError("failed to write `" + tmp_path + "`");
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        throw OutputError("failed to move image into place at `" + path + "`: " + ec.message());
    }
}

cv::Mat tapocam::decode_image(uint8_t const* data, size_t size)
{
    if (data == nullptr || size == 0) {
        throw EncodingError("no image data");
    }

    cv::Mat raw(1, (int)size, CV_8UC1, const_cast<uint8_t*>(data));
    cv::Mat image;
    try {
        image = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (cv::Exception const& e) {
        throw EncodingError(std::string("failed to decode image: ") + e.what());
    }
    if (image.empty()) {
        throw EncodingError("failed to decode image (" + std::to_string(size) + " bytes)");
    }
    return image;
}

std::vector<uint8_t> tapocam::encode_image(cv::Mat const& image, OutputFormat format)
{
    if (image.empty()) {
        throw EncodingError("cannot encode an empty image");
    }

    std::string ext;
    std::vector<int> params;
    cv::Mat source = image;

    switch (format) {
    case OutputFormat::PNG:
        ext = ".png";
        break;
    case OutputFormat::TIFF:
        ext = ".tiff";
        // 1 == COMPRESSION_NONE
        params = { cv::IMWRITE_TIFF_COMPRESSION, 1 };
        break;
    case OutputFormat::BMP:
        ext = ".bmp";
        // BMP stores 8 bits per channel only
        if (image.depth() != CV_8U) {
            double scale = image.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
            image.convertTo(source, CV_MAKETYPE(CV_8U, image.channels()), scale);
        }
        break;
    }

    std::vector<uint8_t> buffer;
    bool ok = false;
    try {
        ok = cv::imencode(ext, source, buffer, params);
    } catch (cv::Exception const& e) {
        throw EncodingError(std::string("failed to encode ") + format_name(format) + ": " + e.what());
    }
    if (!ok || buffer.empty()) {
        throw EncodingError(std::string("failed to encode ") + format_name(format));
    }
    return buffer;
}

void tapocam::write_image(cv::Mat const& image, std::string const& path, OutputFormat format)
{
    auto buffer = encode_image(image, format);
    write_file(path, buffer.data(), buffer.size());
}

cv::Size tapocam::write_encoded_image(std::vector<uint8_t> const& data,
    std::string const& path,
    OutputFormat format)
{
    auto image = decode_image(data.data(), data.size());

    auto source_format = sniff_format(data.data(), data.size());
    if (source_format && *source_format == format) {
        write_file(path, data.data(), data.size());
    } else {
        write_image(image, path, format);
    }

    return image.size();
}
