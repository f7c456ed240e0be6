#include <doctest/doctest.h>
#include <string>

#include "cuelink/handshake.hpp"

using namespace cuelink;

TEST_CASE("CB/2 request with auth and a multi-word name parses") {
    ProtocolError why = ProtocolError::None;
    auto req = HandshakeCodec::parse_request("CB/2 auth=psk1 name=Studio Mac.local\r\n", why);
    REQUIRE(req.has_value());
    CHECK(why == ProtocolError::None);
    CHECK(req->major == 2);
    CHECK(req->legacy == false);
    CHECK(req->auth == "psk1");
    CHECK(req->name == "Studio Mac.local");
    CHECK(HandshakeCodec::display_name(req->name) == "Studio Mac");
    CHECK(HandshakeCodec::reply_for(*req) == "OK/2 hmac=\n");
}

TEST_CASE("Optional request fields: nonce, features, ts; unknown keys ignored") {
    ProtocolError why = ProtocolError::None;
    auto req = HandshakeCodec::parse_request(
        "CB/2.1 auth=psk1 nonce=ab12 features=batch,midi_input ts=1700000000 future=x name=Pad", why);
    REQUIRE(req.has_value());
    CHECK(req->major == 2);
    CHECK(req->nonce == "ab12");
    REQUIRE(req->features.size() == 2);
    CHECK(req->features[0] == "batch");
    CHECK(req->features[1] == "midi_input");
    REQUIRE(req->ts.has_value());
    CHECK(*req->ts == 1700000000);
    CHECK(req->name == "Pad");
}

TEST_CASE("Timestamps that do not fit an integer are ignored, not fatal") {
    for (const char* ts : {"1e300", "-1e300", "inf", "nan", "1e400", "12abc"}) {
        ProtocolError why = ProtocolError::None;
        auto req = HandshakeCodec::parse_request(std::string("CB/2 auth=psk1 ts=") + ts + " name=Studio", why);
        REQUIRE(req.has_value());
        CHECK_FALSE(req->ts.has_value());
        CHECK(req->name == "Studio");
    }
}

TEST_CASE("Legacy hello gets the legacy ack") {
    ProtocolError why = ProtocolError::None;
    auto req = HandshakeCodec::parse_request("CB/1 HELLO", why);
    REQUIRE(req.has_value());
    CHECK(req->major == 1);
    CHECK(req->legacy == true);
    CHECK(HandshakeCodec::reply_for(*req) == "CB/1 HELLO_ACK\n");

    // HELLO on a v2 line is not the legacy form.
    auto v2 = HandshakeCodec::parse_request("CB/2 HELLO", why);
    REQUIRE(v2.has_value());
    CHECK(v2->legacy == false);
}

TEST_CASE("Lines without the CB/ prefix are malformed handshakes") {
    ProtocolError why = ProtocolError::None;
    CHECK_FALSE(HandshakeCodec::parse_request("GET / HTTP/1.1", why).has_value());
    CHECK(why == ProtocolError::MalformedHandshake);
    CHECK_FALSE(HandshakeCodec::parse_request("{\"type\":\"heartbeat\"}", why).has_value());
    CHECK(why == ProtocolError::MalformedHandshake);
    CHECK_FALSE(HandshakeCodec::parse_request("CB/x auth=psk1", why).has_value());
    CHECK(why == ProtocolError::MalformedHandshake);
    CHECK_FALSE(HandshakeCodec::parse_request("", why).has_value());
}

TEST_CASE("Majors outside 1..2 are unsupported") {
    ProtocolError why = ProtocolError::None;
    CHECK_FALSE(HandshakeCodec::parse_request("CB/3 auth=psk1", why).has_value());
    CHECK(why == ProtocolError::UnsupportedVersion);
    CHECK_FALSE(HandshakeCodec::parse_request("CB/0", why).has_value());
    CHECK(why == ProtocolError::UnsupportedVersion);
    CHECK_FALSE(HandshakeCodec::parse_reply("OK/9 hmac=", why).has_value());
    CHECK(why == ProtocolError::UnsupportedVersion);
}

TEST_CASE("Replies: OK/<major> with hmac, and the legacy ack") {
    ProtocolError why = ProtocolError::None;
    auto ok = HandshakeCodec::parse_reply("OK/2 hmac=\n", why);
    REQUIRE(ok.has_value());
    CHECK(ok->major == 2);
    CHECK(ok->hmac.empty());

    auto signed_reply = HandshakeCodec::parse_reply("OK/2 hmac=deadbeef", why);
    REQUIRE(signed_reply.has_value());
    CHECK(signed_reply->hmac == "deadbeef");

    auto ack = HandshakeCodec::parse_reply("CB/1 HELLO_ACK", why);
    REQUIRE(ack.has_value());
    CHECK(ack->legacy == true);
    CHECK(ack->major == 1);

    CHECK_FALSE(HandshakeCodec::parse_reply("CB/2 auth=psk1", why).has_value());
    CHECK(why == ProtocolError::MalformedHandshake);
    CHECK_FALSE(HandshakeCodec::parse_reply("NOPE", why).has_value());
}

TEST_CASE("Built requests parse back to the same fields") {
    HandshakeRequest req;
    req.major = 2;
    req.auth  = HandshakeCodec::DEFAULT_AUTH;
    req.name  = "Cue Bear";
    const std::string line = HandshakeCodec::build_request(req);
    CHECK(line == "CB/2 auth=psk1 name=Cue Bear\n");

    ProtocolError why = ProtocolError::None;
    auto back = HandshakeCodec::parse_request(line, why);
    REQUIRE(back.has_value());
    CHECK(back->name == "Cue Bear");

    req.legacy = true;
    CHECK(HandshakeCodec::build_request(req) == "CB/1 HELLO\n");
}
