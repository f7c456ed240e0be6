#include <doctest/doctest.h>
#include "cuelink/reconnect.hpp"

using namespace cuelink;

TEST_CASE("Backoff schedule: 1 s for attempts 1-5, 3 s for 6-15, 10 s after") {
    for (uint32_t k = 1; k <= 5; ++k)   CHECK(ReconnectionScheduler::delay_for(k) == 1000);
    for (uint32_t k = 6; k <= 15; ++k)  CHECK(ReconnectionScheduler::delay_for(k) == 3000);
    CHECK(ReconnectionScheduler::delay_for(16) == 10000);
    CHECK(ReconnectionScheduler::delay_for(1000000) == 10000);
}

TEST_CASE("on_failure counts up and never stops scheduling") {
    ReconnectionScheduler s;
    uint64_t now = 0;
    CHECK(s.ready(now));
    for (int i = 1; i <= 500; ++i) {
        const uint32_t d = s.on_failure(now);
        CHECK(s.pending());
        CHECK_FALSE(s.ready(now + d - 1));
        CHECK(s.ready(now + d));
        now += d;
    }
    CHECK(s.failures() == 500);
    CHECK(s.on_failure(now) == 10000);
}

TEST_CASE("Success resets the counter; peer_available only cancels the wait") {
    ReconnectionScheduler s;
    for (int i = 0; i < 7; ++i) s.on_failure(0);
    CHECK(s.on_failure(0) == 3000);

    s.peer_available();
    CHECK(s.failures() == 8);
    CHECK_FALSE(s.pending());
    CHECK(s.ready(0));
    CHECK(s.on_failure(0) == 3000);              // attempt 9 stays on the 3 s step

    s.on_failure(100);
    s.reset();
    CHECK_FALSE(s.pending());
    CHECK(s.on_failure(200) == 1000);
}

TEST_CASE("Fixed delay leaves the counter alone; suppress blocks until resume") {
    ReconnectionScheduler s;
    s.on_failure(0);
    s.schedule_fixed(0, 5000);
    CHECK(s.failures() == 1);
    CHECK(s.deadline_ms() == 5000);
    CHECK_FALSE(s.ready(4999));
    CHECK(s.ready(5000));

    s.suppress();
    CHECK_FALSE(s.ready(100000));
    s.resume();
    CHECK(s.ready(100000));
}
