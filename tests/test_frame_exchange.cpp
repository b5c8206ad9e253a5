/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <catch2/catch.hpp>

#include <chrono>
#include <thread>

#include "frame_exchange.hpp"

using namespace tapocam;
using namespace std::chrono_literals;

using Clock = std::chrono::steady_clock;

// Frames are told apart by their width; no pixel buffers are needed.
static VideoFramePtr tagged_frame(int tag)
{
    auto frame = make_videoframe();
    REQUIRE(frame);
    frame->width = tag;
    return frame;
}

TEST_CASE("Stream start is reported once the session plays or fails", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));

    SECTION("nothing happens")
    {
        auto start = Clock::now();
        CHECK(exchange.wait_started(50ms) == StreamStatus::Connecting);
        CHECK(Clock::now() - start >= 45ms);
        CHECK_FALSE(exchange.error());
    }
    SECTION("session plays")
    {
        exchange.set_playing();
        CHECK(exchange.wait_started(0ms) == StreamStatus::Playing);
        CHECK_FALSE(exchange.error());
    }
    SECTION("session fails from another thread")
    {
        std::thread producer([&exchange] {
            std::this_thread::sleep_for(20ms);
            exchange.set_failed("404 Stream Not Found");
        });
        auto status = exchange.wait_started(5s);
        producer.join();

        CHECK(status == StreamStatus::Failed);
        CHECK(exchange.error() == std::optional<std::string>("404 Stream Not Found"));
    }
    SECTION("failure after playing")
    {
        exchange.set_playing();
        exchange.set_failed("The stream ended");
        CHECK(exchange.wait_started(0ms) == StreamStatus::Failed);
    }
}

TEST_CASE("The first stream error is kept", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));

    exchange.set_failed("Failed to get a SDP description (RTSP 401)");
    exchange.set_failed("stream closed");
    exchange.set_playing();

    CHECK(exchange.wait_started(0ms) == StreamStatus::Failed);
    CHECK(exchange.error() == std::optional<std::string>("Failed to get a SDP description (RTSP 401)"));
}

TEST_CASE("An empty stream error still reads as an error", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));
    exchange.set_failed("");
    CHECK(exchange.error() == std::optional<std::string>("stream closed"));
}

TEST_CASE("Reading without a new frame times out", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));
    auto spare = tagged_frame(100);

    auto start = Clock::now();
    auto frame = exchange.try_pop(std::move(spare), 50ms);

    CHECK_FALSE(frame);
    CHECK(Clock::now() - start >= 45ms);
    REQUIRE(spare);
    CHECK(spare->width == 100);
}

TEST_CASE("Only the newest frame is handed out, and only once", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));

    auto returned = exchange.push(tagged_frame(1));
    REQUIRE(returned);
    CHECK(returned->width == 0);

    returned = exchange.push(tagged_frame(2));
    REQUIRE(returned);
    CHECK(returned->width == 1);

    auto frame = exchange.try_pop(tagged_frame(3), 0ms);
    REQUIRE(frame);
    REQUIRE(*frame);
    CHECK((*frame)->width == 2);

    CHECK_FALSE(exchange.try_pop(std::move(*frame), 20ms));

    returned = exchange.push(tagged_frame(4));
    REQUIRE(returned);
    CHECK(returned->width == 3);
}

TEST_CASE("A reader is woken by a frame from the producer thread", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));

    std::thread producer([&exchange] {
        std::this_thread::sleep_for(20ms);
        auto spare = exchange.push(tagged_frame(7));
    });
    auto frame = exchange.try_pop(tagged_frame(8), 5s);
    producer.join();

    REQUIRE(frame);
    CHECK((*frame)->width == 7);
}

TEST_CASE("A failed stream wakes the reader without a frame", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));

    std::thread producer([&exchange] {
        std::this_thread::sleep_for(20ms);
        exchange.set_failed("The stream ended");
    });
    auto start = Clock::now();
    auto frame = exchange.try_pop(tagged_frame(1), 5s);
    producer.join();

    CHECK_FALSE(frame);
    CHECK(Clock::now() - start < 2s);
    CHECK(exchange.error() == std::optional<std::string>("The stream ended"));
}

TEST_CASE("A frame decoded before the failure is still handed out", "[stream]")
{
    FrameExchange exchange(tagged_frame(0));

    auto spare = exchange.push(tagged_frame(5));
    exchange.set_failed("The stream ended");

    auto frame = exchange.try_pop(tagged_frame(6), 0ms);
    REQUIRE(frame);
    CHECK((*frame)->width == 5);
    CHECK_FALSE(exchange.try_pop(std::move(*frame), 0ms));
}
