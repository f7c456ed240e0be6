#include <doctest/doctest.h>
#include <string>

#include "cuelink/security_gate.hpp"

using namespace cuelink;
using nlohmann::json;

static json cc(int channel, int number, int value) {
    return json{{"type", "midi_cc"}, {"channel", channel}, {"cc", number}, {"value", value}};
}

static json batch_of(const std::vector<json>& items) {
    json arr = json::array();
    for (const auto& i : items) arr.push_back(i.dump());
    return json{{"type", "batch"}, {"messages", arr}, {"count", items.size()}, {"timestamp", 1.0}};
}

TEST_CASE("Fingerprint is stable hex FNV-1a and depends on transport kind") {
    const auto a = SecurityGate::fingerprint(TransportKind::Lan, "192.168.1.20");
    CHECK(a.size() == 16);
    CHECK(a == SecurityGate::fingerprint(TransportKind::Lan, "192.168.1.20"));
    CHECK(a != SecurityGate::fingerprint(TransportKind::Tunnel, "192.168.1.20"));
    CHECK(a != SecurityGate::fingerprint(TransportKind::Lan, "192.168.1.21"));
    // FNV-1a 64 of the empty key suffix differs from the offset basis
    CHECK(SecurityGate::fingerprint(TransportKind::Tunnel, "") != "cbf29ce484222325");
}

TEST_CASE("Connection attempts: 20 per 60 s sliding window, refusals not recorded") {
    SecurityGate gate;
    const std::string fp = "peer-a";
    for (int i = 0; i < 20; ++i) CHECK(gate.allow_connection(fp, 1000 + i));
    CHECK_FALSE(gate.allow_connection(fp, 1100));
    CHECK_FALSE(gate.allow_connection(fp, 30000));

    // The first attempt (t=1000) leaves the window at t=61000.
    CHECK(gate.allow_connection(fp, 61000));
    CHECK_FALSE(gate.allow_connection(fp, 61000));

    // Other peers are unaffected.
    CHECK(gate.allow_connection("peer-b", 1100));
    CHECK(gate.stats().rate_limited == 3);
}

TEST_CASE("Messages: 100 per second, then rate-limited until the window slides") {
    SecurityGate gate;
    const std::string fp = "flood";
    size_t accepted = 0, limited = 0;
    for (int i = 0; i < 150; ++i) {
        auto r = gate.inspect(fp, cc(1, 7, 100), 5000);
        accepted += r.accepted.size();
        if (r.error == SecurityError::RateLimited) ++limited;
    }
    CHECK(accepted == 100);
    CHECK(limited == 50);
    CHECK(gate.inspect(fp, cc(1, 7, 100), 6000).accepted.size() == 1);
}

TEST_CASE("Inspect without rate limiting still validates and records nothing") {
    SecurityGate gate;
    for (int i = 0; i < 150; ++i) {
        auto r = gate.inspect("device", cc(1, 7, 100), 5000, false);
        CHECK(r.accepted.size() == 1);
    }
    auto bad = gate.inspect("device", cc(1, 7, 300), 5000, false);
    CHECK(bad.accepted.empty());
    CHECK(bad.error == SecurityError::ValidationFailed);
    CHECK(gate.stats().rate_limited == 0);
    CHECK(gate.stats().message_entries == 0);
}

TEST_CASE("Invalid payloads are dropped silently with validation-failed") {
    SecurityGate gate;
    auto r = gate.inspect("p", cc(1, 200, 1), 1);
    CHECK(r.accepted.empty());
    CHECK(r.dropped == 1);
    CHECK(r.error == SecurityError::ValidationFailed);

    r = gate.inspect("p", json{{"type", "exec"}}, 2);
    CHECK(r.accepted.empty());
    CHECK(r.error == SecurityError::ValidationFailed);
    CHECK(gate.stats().invalid == 2);
}

TEST_CASE("Batches are exploded; bad entries and nested batches drop alone") {
    SecurityGate gate;
    auto nested = batch_of({cc(1, 1, 1)});
    auto r = gate.inspect("p", batch_of({cc(1, 74, 100), cc(0, 1, 1), nested, cc(2, 75, 5)}), 10);
    REQUIRE(r.accepted.size() == 2);
    CHECK(std::get<CcMessage>(r.accepted[0]).number == 74);
    CHECK(std::get<CcMessage>(r.accepted[1]).number == 75);
    CHECK(r.dropped == 2);
    CHECK(r.error == SecurityError::ValidationFailed);
}

TEST_CASE("A batch over 50 entries is rejected whole") {
    SecurityGate gate;
    std::vector<json> items(51, cc(1, 1, 1));
    auto r = gate.inspect("p", batch_of(items), 10);
    CHECK(r.accepted.empty());
    CHECK(r.error == SecurityError::ValidationFailed);

    items.pop_back();
    CHECK(gate.inspect("p", batch_of(items), 11).accepted.size() == 50);
}

TEST_CASE("Garbage collection removes ledgers idle for two windows; clear() forgets a peer") {
    SecurityGate gate;
    gate.allow_connection("old", 1000);
    gate.allow_connection("fresh", 100000);
    CHECK(gate.stats().tracked_peers == 2);

    gate.collect_garbage(1000 + 2 * 60000 - 1);
    CHECK(gate.stats().tracked_peers == 2);
    gate.collect_garbage(1000 + 2 * 60000);
    CHECK(gate.stats().tracked_peers == 1);

    gate.clear("fresh");
    CHECK(gate.stats().tracked_peers == 0);
}

TEST_CASE("Limits are clamped to the fixed ledger capacity") {
    SecurityLimits l;
    l.max_messages = 100000;
    SecurityGate gate(l);
    CHECK(gate.limits().max_messages == SecurityGate::MAX_MESSAGE_SLOTS);
}
