/**
 * @file test_http_routes.cpp
 * @brief Auxiliary HTTP endpoints served beside the WebSocket upgrade.
 */

#include <catch2/catch.hpp>

#include "networking/HttpRoutes.h"

#include <boost/json.hpp>

using nexus::networking::route_http;

namespace {
const nexus::room::Room kRoom{1600, 900};
}

TEST_CASE("GET /health reports ok and the server time", "[http]") {
    auto reply = route_http("GET", "/health", kRoom);
    REQUIRE(reply.status == 200);

    auto body = boost::json::parse(reply.body).as_object();
    REQUIRE(body.at("ok").as_bool());
    REQUIRE(body.at("time").as_int64() > 0);
}

TEST_CASE("GET /room reports the room dimensions", "[http]") {
    auto reply = route_http("GET", "/room?x=1", kRoom);
    REQUIRE(reply.status == 200);

    auto body = boost::json::parse(reply.body).as_object();
    REQUIRE(body.at("width").as_int64() == 1600);
    REQUIRE(body.at("height").as_int64() == 900);
}

TEST_CASE("unknown paths are 404 and other methods 405", "[http]") {
    REQUIRE(route_http("GET", "/", kRoom).status == 404);
    REQUIRE(route_http("GET", "/healthz", kRoom).status == 404);
    REQUIRE(route_http("POST", "/health", kRoom).status == 405);
    REQUIRE(route_http("DELETE", "/nope", kRoom).status == 404);
}
