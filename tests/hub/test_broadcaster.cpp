/**
 * @file test_broadcaster.cpp
 * @brief Unit tests for the routing table and its fan-out modes.
 */

#include <catch2/catch.hpp>

#include "MockTransport.hpp"

#include "hub/Broadcaster.h"

using nexus::hub::Broadcaster;
using test_helpers::MockTransport;

namespace {
struct Routed {
    Routed() : router(transport) {
        router.attach(1, "p-a");
        router.attach(2, "p-b");
        router.attach(3, "p-c");
    }

    MockTransport transport;
    Broadcaster router;
};
} // namespace

TEST_CASE("broadcast reaches every open connection", "[broadcast]") {
    Routed r;
    REQUIRE(r.router.broadcast("x") == 3);
    REQUIRE(r.transport.sent_count(1) == 1);
    REQUIRE(r.transport.sent_count(2) == 1);
    REQUIRE(r.transport.sent_count(3) == 1);
}

TEST_CASE("broadcast skips the excluded connection", "[broadcast]") {
    Routed r;
    REQUIRE(r.router.broadcast("x", 2) == 2);
    REQUIRE(r.transport.sent_count(2) == 0);
}

TEST_CASE("send_to delivers once per listed participant", "[broadcast]") {
    Routed r;
    REQUIRE(r.router.send_to({"p-a", "p-c", "p-a", "p-unknown"}, "x") == 2);
    REQUIRE(r.transport.sent_count(1) == 1);
    REQUIRE(r.transport.sent_count(2) == 0);
    REQUIRE(r.transport.sent_count(3) == 1);
}

TEST_CASE("detached connections receive nothing", "[broadcast]") {
    Routed r;
    r.router.detach(1);
    r.router.detach(1);

    REQUIRE(r.router.size() == 2);
    REQUIRE_FALSE(r.router.client_of("p-a"));
    REQUIRE(r.router.broadcast("x") == 2);
    REQUIRE(r.router.send_to({"p-a"}, "y") == 0);
    REQUIRE(r.transport.sent_count(1) == 0);
}

TEST_CASE("client_of maps participants to connections", "[broadcast]") {
    Routed r;
    REQUIRE(r.router.client_of("p-b") == std::optional<nexus::hub::ClientId>(2));
}
