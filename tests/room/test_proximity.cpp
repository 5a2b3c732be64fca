/**
 * @file test_proximity.cpp
 * @brief Unit tests for the radius query.
 */

#include <catch2/catch.hpp>

#include "room/Proximity.h"

using namespace nexus::room;

namespace {
Participant at(const std::string& id, int x, int y) {
    return Participant{id, id, x, y, "hsl(0 90% 60%)", 0};
}
} // namespace

TEST_CASE("participant 150 away is nearby with radius 200", "[proximity]") {
    Proximity prox(200);
    const auto a = at("A", 100, 100);
    const auto b = at("B", 250, 100);

    REQUIRE(prox.nearby_of(a, {a, b}) == std::vector<std::string>{"B"});
}

TEST_CASE("participant 300 away is not nearby with radius 200", "[proximity]") {
    Proximity prox(200);
    const auto a = at("A", 100, 100);
    const auto b = at("B", 400, 100);

    REQUIRE(prox.nearby_of(a, {a, b}).empty());
}

TEST_CASE("the radius boundary is inclusive", "[proximity]") {
    Proximity prox(200);
    // 120^2 + 160^2 == 200^2
    REQUIRE(prox.within(at("A", 0, 0), at("B", 120, 160)));
    REQUIRE_FALSE(prox.within(at("A", 0, 0), at("B", 121, 160)));
}

TEST_CASE("nearby_of never includes self", "[proximity]") {
    Proximity prox(200);
    const auto a = at("A", 10, 10);
    const auto twin = at("T", 10, 10);

    auto nearby = prox.nearby_of(a, {a, twin});
    REQUIRE(nearby == std::vector<std::string>{"T"});
}

TEST_CASE("large coordinates do not overflow", "[proximity]") {
    Proximity prox(200);
    REQUIRE_FALSE(prox.within(at("A", 0, 0), at("B", 2000000000, 2000000000)));
}
