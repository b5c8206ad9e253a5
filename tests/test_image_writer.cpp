/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>

#include <opencv2/imgcodecs.hpp>

#include "errors.hpp"
#include "fakes.hpp"
#include "image_writer.hpp"

using namespace tapocam;
using namespace tapocam::testing;

TEST_CASE("Every format preserves dimensions and pixels", "[writer]")
{
    TempDir dir;
    auto image = make_test_image(64, 48);

    auto format = GENERATE(OutputFormat::PNG, OutputFormat::TIFF, OutputFormat::BMP);
    auto path = dir.file("frame." + format_extension(format));

    write_image(image, path, format);

    auto loaded = cv::imread(path, cv::IMREAD_UNCHANGED);
    REQUIRE_FALSE(loaded.empty());
    CHECK(loaded.cols == 64);
    CHECK(loaded.rows == 48);
    CHECK(cv::norm(loaded, image, cv::NORM_INF) == 0);

    std::ifstream is(path, std::ios::binary);
    std::vector<uint8_t> head(8);
    is.read(reinterpret_cast<char*>(head.data()), (std::streamsize)head.size());
    CHECK(sniff_format(head.data(), head.size()) == format);
}

TEST_CASE("The format is chosen by argument, not by file extension", "[writer]")
{
    TempDir dir;
    auto path = dir.file("snapshot.out");

    write_image(make_test_image(8, 8), path, OutputFormat::BMP);

    std::ifstream is(path, std::ios::binary);
    char magic[2] = {};
    is.read(magic, 2);
    CHECK(magic[0] == 'B');
    CHECK(magic[1] == 'M');
}

TEST_CASE("JPEG data is re-encoded into the requested format", "[writer]")
{
    TempDir dir;
    auto jpeg = encode_jpeg(make_test_image(320, 240));
    std::vector<uint8_t> data(jpeg.begin(), jpeg.end());

    auto size = write_encoded_image(data, dir.file("out.png"), OutputFormat::PNG);

    CHECK(size == cv::Size(320, 240));
    auto loaded = cv::imread(dir.file("out.png"));
    CHECK(loaded.size() == cv::Size(320, 240));
}

TEST_CASE("Data already in the target format is written unchanged", "[writer]")
{
    TempDir dir;
    std::vector<uint8_t> png;
    cv::imencode(".png", make_test_image(16, 16), png);

    write_encoded_image(png, dir.file("same.png"), OutputFormat::PNG);

    std::ifstream is(dir.file("same.png"), std::ios::binary);
    std::vector<uint8_t> written((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    CHECK(written == png);
}

TEST_CASE("Undecodable data leaves no file behind", "[writer]")
{
    TempDir dir;
    std::vector<uint8_t> garbage { 'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'a', 'g', 'e' };
    auto path = dir.file("broken.png");

    CHECK_THROWS_AS(write_encoded_image(garbage, path, OutputFormat::PNG), EncodingError);
    CHECK_FALSE(std::filesystem::exists(path));
    CHECK_FALSE(std::filesystem::exists(path + ".part"));
}

TEST_CASE("An unwritable target is an output error", "[writer]")
{
    TempDir dir;
    auto path = dir.file("missing-dir/out.png");

    CHECK_THROWS_AS(write_image(make_test_image(4, 4), path, OutputFormat::PNG), OutputError);
}
