#include <doctest/doctest.h>
#include <string>

#include "cuelink/heartbeat.hpp"

using namespace cuelink;

TEST_CASE("Heartbeat is due once per interval after the last one sent") {
    HeartbeatMonitor hb(1000, 3000);
    hb.reset(10000);
    CHECK_FALSE(hb.heartbeat_due(10999));
    CHECK(hb.heartbeat_due(11000));
    hb.on_heartbeat_sent(11000);
    CHECK_FALSE(hb.heartbeat_due(11500));
    CHECK(hb.heartbeat_due(12000));
}

TEST_CASE("Liveness counts receives only; stale strictly after the threshold") {
    HeartbeatMonitor hb(1000, 3000);
    hb.reset(0);
    hb.on_heartbeat_sent(2000);               // our own sends do not keep the link alive
    CHECK_FALSE(hb.is_stale(3000));
    CHECK(hb.is_stale(3001));
    CHECK(hb.silence_ms(3001) == 3001);

    hb.on_receive(3001);
    CHECK_FALSE(hb.is_stale(6001));
    CHECK(hb.is_stale(6002));
}

TEST_CASE("Quality degrades past half the threshold") {
    HeartbeatMonitor hb(2000, 30000);
    hb.reset(0);
    CHECK(hb.quality(15000) == LinkQuality::Connected);
    CHECK(hb.quality(15001) == LinkQuality::Degraded);
    CHECK(hb.quality(30001) == LinkQuality::Disconnected);
    CHECK(std::string(to_string(LinkQuality::Degraded)) == "degraded");
}

TEST_CASE("Zero interval / threshold disable emission / liveness") {
    HeartbeatMonitor hb(0, 0);
    hb.reset(0);
    CHECK_FALSE(hb.heartbeat_due(1000000));
    CHECK_FALSE(hb.is_stale(1000000));
    CHECK(hb.quality(1000000) == LinkQuality::Connected);
}
