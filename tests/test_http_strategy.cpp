/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <catch2/catch.hpp>

#include <filesystem>

#include <opencv2/imgcodecs.hpp>

#include "fakes.hpp"
#include "http_strategy.hpp"
#include "tapo_api.hpp"

using namespace tapocam;
using namespace tapocam::testing;

namespace fs = std::filesystem;

namespace {

DeviceEndpoint const device { "10.0.0.5", "admin", "secret" };

HttpResponse jpeg_snapshot(int width, int height)
{
    return { 200, "image/jpeg", encode_jpeg(make_test_image(width, height)) };
}

HttpResponse json_snapshot(int width, int height)
{
    auto payload = base64_encode(encode_jpeg(make_test_image(width, height)));
    return json_response(R"({"error_code":0,"result":{"image":{"snapshot":")" + payload + R"("}}})");
}

} // namespace

TEST_CASE("HTTP capture logs in and saves the snapshot", "[http]")
{
    TempDir dir;
    auto log = std::make_shared<FakeTransport::Log>();
    auto transport = std::make_unique<FakeTransport>(log);
    transport->reply(login_ok("abc123")).reply(jpeg_snapshot(64, 48));

    HttpStrategy strategy(HttpSettings {}, false, std::move(transport));
    CHECK(strategy.state() == HttpState::NoToken);

    auto path = dir.file("snap.png");
    auto result = strategy.attempt(device, { path, OutputFormat::PNG });

    REQUIRE(result.success_);
    CHECK(result.message_ == "Image captured via HTTP API: 64x48");
    CHECK(result.output_path_ == path);
    CHECK(strategy.state() == HttpState::Succeeded);
    CHECK(strategy.token() == "abc123");

    REQUIRE(log->requests_.size() == 2);
    CHECK(log->requests_[0].url_ == "http://10.0.0.5/stok=0/ds");
    CHECK(log->requests_[0].timeout_ == std::chrono::milliseconds(10'000));
    CHECK(log->requests_[1].url_ == "http://10.0.0.5/stok=abc123/ds");
    CHECK(log->requests_[1].timeout_ == std::chrono::milliseconds(15'000));

    auto written = cv::imread(path, cv::IMREAD_UNCHANGED);
    CHECK(written.cols == 64);
    CHECK(written.rows == 48);
}

TEST_CASE("A rejected login never requests a snapshot", "[http]")
{
    TempDir dir;
    auto log = std::make_shared<FakeTransport::Log>();
    auto transport = std::make_unique<FakeTransport>(log);
    transport->reply(json_response(R"({"error_code":-40401})")).reply(jpeg_snapshot(8, 8));

    HttpStrategy strategy(HttpSettings {}, false, std::move(transport));
    auto path = dir.file("snap.png");
    auto result = strategy.attempt(device, { path, OutputFormat::PNG });

    CHECK_FALSE(result.success_);
    CHECK(result.message_.find("HTTP API authentication failed") == 0);
    CHECK(log->requests_.size() == 1);
    CHECK(strategy.state() == HttpState::Failed);
    CHECK(strategy.token().empty());
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("An unreachable device fails authentication", "[http]")
{
    auto log = std::make_shared<FakeTransport::Log>();
    HttpStrategy strategy(HttpSettings {}, false, std::make_unique<FakeTransport>(log));

    auto result = strategy.attempt(device, { "unused.png", OutputFormat::PNG });

    CHECK_FALSE(result.success_);
    CHECK(result.message_ == "HTTP API authentication failed: connection refused");
}

TEST_CASE("The session token is reused by later captures", "[http]")
{
    TempDir dir;
    auto log = std::make_shared<FakeTransport::Log>();
    auto transport = std::make_unique<FakeTransport>(log);
    transport->reply(login_ok("abc123")).reply(jpeg_snapshot(16, 16)).reply(jpeg_snapshot(16, 16));

    HttpStrategy strategy(HttpSettings {}, false, std::move(transport));

    REQUIRE(strategy.attempt(device, { dir.file("a.png"), OutputFormat::PNG }).success_);
    REQUIRE(strategy.attempt(device, { dir.file("b.png"), OutputFormat::PNG }).success_);

    REQUIRE(log->requests_.size() == 3);
    CHECK(log->requests_[2].url_ == "http://10.0.0.5/stok=abc123/ds");
}

TEST_CASE("Snapshots delivered inside JSON are decoded", "[http]")
{
    TempDir dir;
    auto log = std::make_shared<FakeTransport::Log>();
    auto transport = std::make_unique<FakeTransport>(log);
    transport->reply(login_ok("abc123")).reply(json_snapshot(40, 30));

    HttpStrategy strategy(HttpSettings {}, false, std::move(transport));
    auto path = dir.file("snap.bmp");
    auto result = strategy.attempt(device, { path, OutputFormat::BMP });

    REQUIRE(result.success_);
    CHECK(result.message_ == "Image captured via HTTP API: 40x30");

    auto written = cv::imread(path, cv::IMREAD_UNCHANGED);
    CHECK(written.size() == cv::Size(40, 30));
}

TEST_CASE("Snapshot responses the camera should not send are failures", "[http]")
{
    TempDir dir;
    auto log = std::make_shared<FakeTransport::Log>();
    auto transport = std::make_unique<FakeTransport>(log);
    transport->reply(login_ok("abc123"));

    std::string expected;
    SECTION("unexpected content type")
    {
        transport->reply(HttpResponse { 200, "text/html", "<html></html>" });
        expected = "HTTP capture failed: unexpected snapshot content type `text/html`";
    }
    SECTION("error status")
    {
        transport->reply(HttpResponse { 500, "text/plain", "" });
        expected = "HTTP capture failed: HTTP API failed: 500";
    }
    SECTION("image body that does not decode")
    {
        transport->reply(HttpResponse { 200, "image/jpeg", "not a jpeg" });
        expected = "HTTP capture failed: failed to decode image";
    }

    HttpStrategy strategy(HttpSettings {}, false, std::move(transport));
    auto path = dir.file("snap.png");
    auto result = strategy.attempt(device, { path, OutputFormat::PNG });

    CHECK_FALSE(result.success_);
    CHECK(result.message_.rfind(expected, 0) == 0);
    CHECK(strategy.state() == HttpState::Failed);
    CHECK_FALSE(fs::exists(path));
}

TEST_CASE("A stale token is refreshed only when asked to", "[http]")
{
    TempDir dir;
    auto log = std::make_shared<FakeTransport::Log>();
    auto transport = std::make_unique<FakeTransport>(log);
    transport->reply(login_ok("first")).reply(jpeg_snapshot(16, 16));
    transport->reply(json_response(R"({"error_code":-40401})"));

    HttpSettings settings;

    SECTION("refresh disabled")
    {
        settings.refresh_stale_token_ = false;
        HttpStrategy strategy(settings, false, std::move(transport));

        REQUIRE(strategy.attempt(device, { dir.file("a.png"), OutputFormat::PNG }).success_);
        auto result = strategy.attempt(device, { dir.file("b.png"), OutputFormat::PNG });

        CHECK_FALSE(result.success_);
        CHECK(result.message_ == "HTTP capture failed: session token expired");
        CHECK(log->requests_.size() == 3);
    }
    SECTION("refresh enabled")
    {
        settings.refresh_stale_token_ = true;
        transport->reply(login_ok("second")).reply(jpeg_snapshot(16, 16));
        HttpStrategy strategy(settings, false, std::move(transport));

        REQUIRE(strategy.attempt(device, { dir.file("a.png"), OutputFormat::PNG }).success_);
        auto result = strategy.attempt(device, { dir.file("b.png"), OutputFormat::PNG });

        CHECK(result.success_);
        CHECK(strategy.token() == "second");
        REQUIRE(log->requests_.size() == 5);
        CHECK(log->requests_[3].url_ == "http://10.0.0.5/stok=0/ds");
        CHECK(log->requests_[4].url_ == "http://10.0.0.5/stok=second/ds");
    }
}

TEST_CASE("HTTP states have names", "[http]")
{
    CHECK(std::string(to_string(HttpState::NoToken)) == "NoToken");
    CHECK(std::string(to_string(HttpState::SnapshotRequested)) == "SnapshotRequested");
    CHECK(std::string(to_string(HttpState::Failed)) == "Failed");
}
