#include <doctest/doctest.h>
#include <string>

#include "cuelink/framer.hpp"

using namespace cuelink;
using nlohmann::json;

static void feed(LineSplitter& s, const std::string& bytes) {
    s.feed(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

TEST_CASE("LineSplitter yields complete lines across partial reads, CRLF tolerated") {
    LineSplitter s;
    std::string line;
    feed(s, "{\"type\":\"heart");
    CHECK_FALSE(s.next_line(line));
    feed(s, "beat\"}\r\nCB/2 auth=psk1\n\n");
    REQUIRE(s.next_line(line));
    CHECK(line == "{\"type\":\"heartbeat\"}");
    REQUIRE(s.next_line(line));
    CHECK(line == "CB/2 auth=psk1");
    REQUIRE(s.next_line(line));
    CHECK(line.empty());
    CHECK_FALSE(s.next_line(line));
    CHECK(s.buffered() == 0);
}

TEST_CASE("LineSplitter drops an oversized line and resynchronizes at the next newline") {
    LineSplitter s(16);
    std::string line;
    feed(s, "ok\n");
    feed(s, std::string(40, 'x'));
    CHECK(s.overflows() == 1);
    feed(s, "yyy\nnext\n");

    REQUIRE(s.next_line(line));
    CHECK(line == "ok");                  // complete lines before the overflow survive
    REQUIRE(s.next_line(line));
    CHECK(line == "next");
    CHECK_FALSE(s.next_line(line));
}

TEST_CASE("parse_object accepts only JSON objects") {
    ProtocolError why = ProtocolError::None;
    CHECK(MessageFramer::parse_object("{\"type\":\"heartbeat\"}", why).has_value());
    CHECK(why == ProtocolError::None);
    CHECK_FALSE(MessageFramer::parse_object("[1,2]", why).has_value());
    CHECK(why == ProtocolError::MalformedFrame);
    CHECK_FALSE(MessageFramer::parse_object("{\"type\":", why).has_value());
    CHECK(why == ProtocolError::MalformedFrame);
    CHECK_FALSE(MessageFramer::parse_object("CB/2", why).has_value());
}

TEST_CASE("OutgoingBatch: one entry goes out bare, several in an envelope with count") {
    OutgoingBatch b;
    auto cc = make_cc(1, 74, 100);
    REQUIRE(cc.has_value());

    REQUIRE(b.push(serialize(Message{*cc}), 500));
    CHECK(b.created_ms() == 500);
    CHECK(b.deadline_ms() == 510);
    CHECK_FALSE(b.due(505));
    CHECK(b.due(510));
    const std::string single = b.take_frame(1.0);
    CHECK(single == serialize(Message{*cc}) + "\n");
    CHECK(b.empty());

    for (int i = 0; i < 5; ++i) REQUIRE(b.push(serialize(Message{*cc}), 600));
    CHECK(b.due(600));                    // batch_size reached
    const std::string frame = b.take_frame(2.5);
    REQUIRE(frame.back() == '\n');
    const json j = json::parse(frame);
    CHECK(j["type"] == "batch");
    CHECK(j["count"] == 5);
    CHECK(j["messages"].size() == 5);
    CHECK(j["timestamp"] == 2.5);
    CHECK(json::parse(j["messages"][0].get<std::string>())["cc"] == 74);
}

TEST_CASE("OutgoingBatch never holds more than its cap") {
    OutgoingBatch b(BatchPolicy{1000, 10});
    for (size_t i = 0; i < OutgoingBatch::MAX_BATCH_SIZE; ++i) {
        REQUIRE(b.push("{\"type\":\"heartbeat\"}", 1));
    }
    CHECK(b.full());
    CHECK_FALSE(b.push("{\"type\":\"heartbeat\"}", 1));
    CHECK(b.size() == OutgoingBatch::MAX_BATCH_SIZE);
}
