/**
 * @file test_move_and_chat.cpp
 * @brief Movement, proximity pushes and proximity-scoped chat through the hub.
 */

#include <catch2/catch.hpp>

#include "test_utils.hpp"

using namespace test_helpers;

namespace {
std::vector<std::string> nearby_ids(const boost::json::object& proximity) {
    std::vector<std::string> out;
    for (const auto& v : proximity.at("nearby").as_array()) out.push_back(str(v));
    return out;
}
} // namespace

// =============================================================================
// Movement
// =============================================================================

TEST_CASE("move is broadcast to others and clamped to the room", "[move]") {
    HubFixture f;
    const auto a = f.connect(1);
    f.connect(2);
    f.place(1, 10, 10);
    f.transport.clear();

    f.advance(1s);
    f.send(1, move_frame(-50, 5000));

    REQUIRE(f.transport.frames_of(1, "moved").empty());
    auto moved = f.transport.frames_of(2, "moved");
    REQUIRE(moved.size() == 1);
    REQUIRE(str(moved[0].at("id")) == a);
    REQUIRE(moved[0].at("x").as_int64() == 0);
    REQUIRE(moved[0].at("y").as_int64() == f.cfg.room_height);

    const auto stored = f.hub.registry().find(a);
    REQUIRE(stored->x() == 0);
    REQUIRE(stored->y() == f.cfg.room_height);
}

TEST_CASE("coordinates are rounded and numeric strings accepted", "[move]") {
    HubFixture f;
    const auto a = f.connect(1);
    f.place(1, 10, 10);

    f.advance(1s);
    f.send(1, R"({"type":"move","payload":{"x":"20.5","y":30.4}})");
    REQUIRE(f.hub.registry().find(a)->x() == 21);
    REQUIRE(f.hub.registry().find(a)->y() == 30);
}

TEST_CASE("moves inside the rate window are dropped", "[move][rate]") {
    HubFixture f;
    const auto a = f.connect(1);
    f.connect(2);
    f.place(1, 10, 10);
    f.transport.clear();

    f.advance(5ms);
    f.send(1, move_frame(50, 50));
    REQUIRE(f.transport.frames_of(2, "moved").empty());
    REQUIRE(f.hub.registry().find(a)->x() == 10);

    f.advance(f.cfg.move_rate_limit);
    f.send(1, move_frame(50, 50));
    REQUIRE(f.transport.frames_of(2, "moved").size() == 1);
}

TEST_CASE("a move to the current position broadcasts nothing but uses the gate", "[move][rate]") {
    HubFixture f;
    f.connect(1);
    f.connect(2);
    f.place(1, 300, 300);
    f.transport.clear();

    f.advance(1s);
    f.send(1, move_frame(300, 300));
    f.send(1, move_frame(301, 300));
    REQUIRE(f.transport.sent_count(1) == 0);
    REQUIRE(f.transport.sent_count(2) == 0);

    f.advance(f.cfg.move_rate_limit);
    f.send(1, move_frame(301, 300));
    REQUIRE(f.transport.frames_of(2, "moved").size() == 1);
}

TEST_CASE("a rejected move does not use the gate", "[move][rate]") {
    HubFixture f;
    f.connect(1);
    f.connect(2);
    f.place(1, 300, 300);
    f.transport.clear();

    f.advance(1s);
    f.send(1, R"({"type":"move","payload":{"x":"abc","y":1}})");
    f.send(1, move_frame(310, 300));
    REQUIRE(f.transport.frames_of(2, "moved").size() == 1);
}

// =============================================================================
// Proximity
// =============================================================================

TEST_CASE("the mover is told who is nearby", "[move][proximity]") {
    HubFixture f;
    const auto a = f.connect(1);
    const auto b = f.connect(2);
    f.place(1, 100, 100);
    f.place(2, 250, 100);

    auto pushes = f.transport.frames_of(2, "proximity");
    REQUIRE_FALSE(pushes.empty());
    REQUIRE(str(pushes.back().at("selfId")) == b);
    REQUIRE(nearby_ids(pushes.back()) == std::vector<std::string>{a});

    f.transport.clear();
    f.advance(1s);
    f.send(2, move_frame(400, 100));

    pushes = f.transport.frames_of(2, "proximity");
    REQUIRE(pushes.size() == 1);
    REQUIRE(nearby_ids(pushes[0]).empty());

    // Only the mover is pushed; A hears a moved frame.
    REQUIRE(f.transport.frames_of(1, "proximity").empty());
    REQUIRE(f.transport.frames_of(1, "moved").size() == 1);
}

// =============================================================================
// Chat
// =============================================================================

TEST_CASE("chat reaches the sender and nearby participants only", "[chat]") {
    HubFixture f;
    const auto a = f.connect(1);
    f.connect(2);
    f.connect(3);
    f.place(1, 100, 100);
    f.place(2, 250, 100);
    f.place(3, 1000, 800);
    f.transport.clear();

    f.send(1, chat_frame("  hello <b>there</b>  "));

    for (ClientId c : {1, 2}) {
        auto chats = f.transport.frames_of(c, "chat");
        REQUIRE(chats.size() == 1);
        REQUIRE(str(chats[0].at("senderId")) == a);
        REQUIRE(str(chats[0].at("message")) == "hello bthere/b");
        REQUIRE(chats[0].at("timestamp").as_int64() > 0);
    }
    REQUIRE(f.transport.sent_count(3) == 0);
}

TEST_CASE("chat with no one nearby returns chat_error to the sender", "[chat]") {
    HubFixture f;
    f.connect(1);
    f.connect(2);
    f.place(1, 100, 100);
    f.place(2, 1000, 800);
    f.transport.clear();

    f.send(1, chat_frame("anyone?"));

    auto errors = f.transport.frames_of(1, "chat_error");
    REQUIRE(errors.size() == 1);
    REQUIRE(str(errors[0].at("message")) == "No one nearby to chat with");
    REQUIRE(f.transport.frames_of(1, "chat").empty());
    REQUIRE(f.transport.sent_count(2) == 0);
}

TEST_CASE("chat inside the rate window is dropped silently", "[chat][rate]") {
    HubFixture f;
    f.connect(1);
    f.connect(2);
    f.place(1, 100, 100);
    f.place(2, 150, 100);
    f.transport.clear();

    f.send(1, chat_frame("one"));
    f.advance(500ms);
    f.send(1, chat_frame("two"));
    REQUIRE(f.transport.frames_of(2, "chat").size() == 1);
    REQUIRE(f.transport.frames_of(1, "chat_error").empty());

    f.advance(500ms);
    f.send(1, chat_frame("three"));
    auto chats = f.transport.frames_of(2, "chat");
    REQUIRE(chats.size() == 2);
    REQUIRE(str(chats[1].at("message")) == "three");
}

TEST_CASE("empty chat does not use the gate", "[chat][rate]") {
    HubFixture f;
    f.connect(1);
    f.connect(2);
    f.place(1, 100, 100);
    f.place(2, 150, 100);
    f.transport.clear();

    f.send(1, chat_frame("   "));
    f.send(1, chat_frame("real"));
    REQUIRE(f.transport.frames_of(2, "chat").size() == 1);
}

TEST_CASE("chat is clamped to the maximum length", "[chat]") {
    HubFixture f;
    f.connect(1);
    f.connect(2);
    f.place(1, 100, 100);
    f.place(2, 150, 100);
    f.transport.clear();

    f.send(1, chat_frame(std::string(500, 'q')));
    auto chats = f.transport.frames_of(2, "chat");
    REQUIRE(chats.size() == 1);
    REQUIRE(str(chats[0].at("message")).size() == f.cfg.max_chat_length);
}
