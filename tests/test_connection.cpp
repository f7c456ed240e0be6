#include <doctest/doctest.h>
#include <string>

#include "cuelink/connection.hpp"

using namespace cuelink;

static void walk_to_active(ConnectionFsm& fsm) {
    REQUIRE(fsm.apply(LinkEvent::Start).changed());
    REQUIRE(fsm.apply(LinkEvent::SocketReady).changed());
    REQUIRE(fsm.apply(LinkEvent::Established).changed());
    REQUIRE(fsm.apply(LinkEvent::HandshakeAccepted).changed());
    REQUIRE(fsm.state() == LinkState::Active);
}

TEST_CASE("Listener path: Idle -> Listening -> Connecting -> AwaitingHandshake -> Active") {
    ConnectionFsm fsm(LinkState::Listening);
    CHECK(fsm.state() == LinkState::Idle);
    CHECK(fsm.apply(LinkEvent::Start).to == LinkState::Listening);
    CHECK_FALSE(fsm.has_connection());
    CHECK(fsm.apply(LinkEvent::SocketReady).to == LinkState::Connecting);
    CHECK(fsm.has_connection());
    CHECK(fsm.apply(LinkEvent::Established).to == LinkState::AwaitingHandshake);
    CHECK(fsm.apply(LinkEvent::HandshakeAccepted).to == LinkState::Active);
}

TEST_CASE("Rejected handshake lines keep the state; timeout is an error disconnect") {
    ConnectionFsm fsm(LinkState::Discovering);
    fsm.apply(LinkEvent::Start);
    fsm.apply(LinkEvent::SocketReady);
    fsm.apply(LinkEvent::Established);

    auto t = fsm.apply(LinkEvent::LineRejected);
    CHECK(t.accepted);
    CHECK_FALSE(t.changed());
    CHECK(fsm.state() == LinkState::AwaitingHandshake);

    t = fsm.apply(LinkEvent::HandshakeTimeout);
    CHECK(t.to == LinkState::Disconnected);
    CHECK(t.reason == DisconnectReason::Error);

    t = fsm.apply(LinkEvent::Rearm);
    CHECK(t.to == LinkState::Discovering);
}

TEST_CASE("Active ends as stale on liveness expiry, error on socket trouble") {
    ConnectionFsm a;
    walk_to_active(a);
    auto t = a.apply(LinkEvent::LivenessExpired);
    CHECK(t.to == LinkState::Disconnected);
    CHECK(t.reason == DisconnectReason::Stale);

    ConnectionFsm b;
    walk_to_active(b);
    CHECK(b.apply(LinkEvent::PeerClosed).reason == DisconnectReason::Error);
}

TEST_CASE("Stop wins from any live state and only Start leaves it") {
    ConnectionFsm fsm;
    walk_to_active(fsm);
    auto t = fsm.apply(LinkEvent::Stop);
    CHECK(t.to == LinkState::Disconnected);
    CHECK(t.reason == DisconnectReason::User);

    CHECK_FALSE(fsm.apply(LinkEvent::Stop).accepted);
    CHECK_FALSE(fsm.apply(LinkEvent::Rearm).accepted);
    CHECK(fsm.state() == LinkState::Disconnected);
    CHECK(fsm.apply(LinkEvent::Start).to == LinkState::Listening);

    ConnectionFsm idle;
    CHECK_FALSE(idle.apply(LinkEvent::Stop).accepted);
    CHECK(idle.state() == LinkState::Idle);
}

TEST_CASE("Events that do not apply are rejected without side effects") {
    ConnectionFsm fsm;
    CHECK_FALSE(fsm.apply(LinkEvent::HandshakeAccepted).accepted);
    fsm.apply(LinkEvent::Start);
    CHECK_FALSE(fsm.apply(LinkEvent::Established).accepted);
    CHECK_FALSE(fsm.apply(LinkEvent::LivenessExpired).accepted);
    CHECK(fsm.state() == LinkState::Listening);
}

TEST_CASE("A timer armed for one connection never fires for the next") {
    ConnTimer t;
    t.arm(7, 1000);
    CHECK_FALSE(t.fires(7, 999));
    CHECK(t.fires(7, 1000));
    CHECK_FALSE(t.fires(8, 5000));
    t.disarm();
    CHECK_FALSE(t.fires(7, 5000));
}

TEST_CASE("Enum names used in log lines") {
    CHECK(std::string(to_string(LinkState::AwaitingHandshake)) == "awaiting-handshake");
    CHECK(std::string(to_string(DisconnectReason::Stale)) == "stale");
    CHECK(std::string(to_string(TransportKind::Lan)) == "lan");
    CHECK(Endpoint{TransportKind::Lan, "10.0.0.2", 9361, "Studio"}.address() == "10.0.0.2:9361");
}
