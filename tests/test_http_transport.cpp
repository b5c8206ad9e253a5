/*
 * Copyright (c) 2022, Bostjan Vesnicer
 *
 * SPDX-License-Identifier: BSD-2-Clause
 */

#include <catch2/catch.hpp>

#include <chrono>
#include <string>

#include "errors.hpp"
#include "http_transport.hpp"

using namespace tapocam;
using namespace std::chrono_literals;

// Port 1 on the loopback interface has no listener, so every request is
// refused without leaving the machine.
static std::string const unreachable = "http://127.0.0.1:1/stok=0/ds";

TEST_CASE("A transport reports every failed request with its own reason", "[http]")
{
    auto transport = make_curl_transport();

    for (int i = 0; i < 3; i++) {
        // the body goes out of scope before the next request reuses the handle
        std::string body = R"({"method":"login","attempt":)" + std::to_string(i) + "}";
        try {
            transport->post_json(unreachable, body, 2s);
            FAIL("request to a closed port succeeded");
        } catch (ConnectionError const& e) {
            std::string message = e.what();
            CHECK(message.rfind("request to " + unreachable + " failed: ", 0) == 0);
            CHECK(message.size() > ("request to " + unreachable + " failed: ").size());
        }
    }
}

TEST_CASE("Transports are independent of each other", "[http]")
{
    auto first = make_curl_transport();
    {
        auto second = make_curl_transport();
        CHECK_THROWS_AS(second->post_json(unreachable, "{}", 2s), ConnectionError);
    }
    CHECK_THROWS_AS(first->post_json(unreachable, "{}", 2s), ConnectionError);
}
