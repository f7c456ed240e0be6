#include <doctest/doctest.h>
#include <string>

#include "cuelink/transport/discovery.hpp"

using namespace cuelink;
using namespace cuelink::transport;

static std::string beacon(const std::string& name, int port, int ttl = 5) {
    return "{\"service\":\"_cuebear._tcp\",\"name\":\"" + name + "\",\"port\":" + std::to_string(port) +
           ",\"ttl\":" + std::to_string(ttl) + "}";
}

TEST_CASE("Beacon decode requires service, name and a valid port") {
    auto b = decode_beacon(beacon("Studio Mac", 9361, 7));
    REQUIRE(b.has_value());
    CHECK(b->service == "_cuebear._tcp");
    CHECK(b->name == "Studio Mac");
    CHECK(b->port == 9361);
    CHECK(b->ttl_s == 7);

    CHECK_FALSE(decode_beacon("not json").has_value());
    CHECK_FALSE(decode_beacon(R"({"service":"_cuebear._tcp","name":"x"})").has_value());
    CHECK_FALSE(decode_beacon(R"({"service":"_cuebear._tcp","name":"x","port":0})").has_value());
    CHECK_FALSE(decode_beacon(R"({"service":"_cuebear._tcp","name":"x","port":70000})").has_value());

    auto no_ttl = decode_beacon(R"({"service":"_cuebear._tcp","name":"x","port":9361})");
    REQUIRE(no_ttl.has_value());
    CHECK(no_ttl->ttl_s == 5);
}

TEST_CASE("Advertiser beacon decodes to what was configured") {
    DiscoveryConfig cfg;
    cfg.ttl_s = 9;
    ServiceAdvertiser adv(cfg, "Rig B", 9361);
    auto b = decode_beacon(encode_beacon(adv.beacon()));
    REQUIRE(b.has_value());
    CHECK(b->name == "Rig B");
    CHECK(b->port == 9361);
    CHECK(b->ttl_s == 9);
    CHECK(adv.sent() == 0);
}

TEST_CASE("Browser takes the host from the sender and flags new peers once") {
    ServiceBrowser browser(DiscoveryConfig{}, TransportKind::Lan);
    CHECK_FALSE(browser.current(0).has_value());

    browser.observe(beacon("Studio Mac", 9361), "192.168.1.20", 1000);
    auto ep = browser.current(1000);
    REQUIRE(ep.has_value());
    CHECK(ep->host == "192.168.1.20");
    CHECK(ep->port == 9361);
    CHECK(ep->name == "Studio Mac");
    CHECK(ep->kind == TransportKind::Lan);

    CHECK(browser.take_new_peer());
    CHECK_FALSE(browser.take_new_peer());

    browser.observe(beacon("Studio Mac", 9361), "192.168.1.20", 2000);   // refresh only
    CHECK_FALSE(browser.take_new_peer());
}

TEST_CASE("Browser ignores other services and prefers the most recently heard") {
    ServiceBrowser browser(DiscoveryConfig{}, TransportKind::Lan);
    browser.observe(R"({"service":"_other._tcp","name":"Printer","port":631})", "192.168.1.9", 0);
    CHECK(browser.size() == 0);

    browser.observe(beacon("A", 9361), "192.168.1.20", 100);
    browser.observe(beacon("B", 9371), "192.168.1.21", 200);
    CHECK(browser.size() == 2);
    CHECK(browser.current(300)->name == "B");

    browser.observe(beacon("A", 9361), "192.168.1.20", 400);
    CHECK(browser.current(500)->name == "A");
}

TEST_CASE("Entries lapse when their TTL passes without a fresh beacon") {
    ServiceBrowser browser(DiscoveryConfig{}, TransportKind::Lan);
    browser.observe(beacon("Studio Mac", 9361, 2), "192.168.1.20", 1000);
    CHECK(browser.current(2999).has_value());
    CHECK_FALSE(browser.current(3000).has_value());
}

TEST_CASE("A flood of distinct names stays within the table capacity") {
    ServiceBrowser browser(DiscoveryConfig{}, TransportKind::Lan);
    const int total = static_cast<int>(ServiceBrowser::MAX_SERVICES) + 10;
    for (int i = 0; i < total; ++i) {
        browser.observe(beacon("node-" + std::to_string(i), 9361, 3600), "192.168.1.50", 1000 + i);
    }
    CHECK(browser.size() == ServiceBrowser::MAX_SERVICES);

    auto ep = browser.current(2000);
    REQUIRE(ep.has_value());
    CHECK(ep->name == "node-" + std::to_string(total - 1));

    // The earliest names were the ones dropped; a fresh beacon brings one back.
    browser.observe(beacon("node-0", 9361), "192.168.1.50", 3000);
    CHECK(browser.size() == ServiceBrowser::MAX_SERVICES);
    CHECK(browser.current(3000)->name == "node-0");
}

TEST_CASE("Static endpoint always answers the configured target") {
    StaticEndpoint fixed(Endpoint{TransportKind::Lan, "10.0.0.4", 9361, "Desk"});
    auto ep = fixed.current(123);
    REQUIRE(ep.has_value());
    CHECK(ep->address() == "10.0.0.4:9361");
    CHECK_FALSE(fixed.take_new_peer());
}
