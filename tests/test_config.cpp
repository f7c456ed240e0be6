#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include "cuelink/config.hpp"

using namespace cuelink;
using nlohmann::json;
namespace fs = std::filesystem;

static fs::path scratch(const std::string& leaf) {
    auto dir = fs::temp_directory_path() / "cuelink-test-config";
    fs::create_directories(dir);
    auto p = dir / leaf;
    fs::remove(p);
    return p;
}

static void write_file(const fs::path& p, const std::string& text) {
    std::ofstream o(p, std::ios::trunc);
    o << text;
}

TEST_CASE("Defaults carry the wire constants") {
    LinkConfig cfg;
    std::string err;
    CHECK(validate(cfg, err));
    CHECK(cfg.role == DeploymentRole::Device);
    CHECK(cfg.tunnel.port == 9360);
    CHECK(cfg.lan.port == 9361);
    CHECK(cfg.lan.discovery.group == "239.255.42.99");
    CHECK(cfg.lan.discovery.port == 9362);
    CHECK(cfg.lan.discovery.service == "_cuebear._tcp");
    CHECK(cfg.batch.batch_size == 5);
    CHECK(cfg.batch.batch_timeout_ms == 10);
    CHECK(cfg.security.max_connection_attempts == 20);
    CHECK(cfg.security.max_messages == 100);
    CHECK(cfg.handshake_timeout_ms == 3000);
}

TEST_CASE("A missing file leaves the defaults in place") {
    LinkConfig cfg;
    std::string err;
    CHECK(load_config(scratch("absent.json"), cfg, err));
    CHECK(err.empty());
    CHECK(cfg.name == "cuelink");
}

TEST_CASE("Partial files override only the keys they name") {
    auto p = scratch("partial.json");
    write_file(p, R"({"role":"host","name":"Studio Mac","lan":{"static_host":"10.0.0.4","stale_ms":20000},
                     "batch":{"size":8}})");
    LinkConfig cfg;
    std::string err;
    REQUIRE(load_config(p, cfg, err));
    CHECK(cfg.role == DeploymentRole::Host);
    CHECK(cfg.name == "Studio Mac");
    CHECK(cfg.lan.static_host == "10.0.0.4");
    CHECK(cfg.lan.stale_after_ms == 20000);
    CHECK(cfg.lan.heartbeat_interval_ms == 2000);
    CHECK(cfg.batch.batch_size == 8);
    CHECK(cfg.tunnel.port == 9360);
}

TEST_CASE("Bad files are reported and leave the config untouched") {
    LinkConfig cfg;
    std::string err;

    auto broken = scratch("broken.json");
    write_file(broken, "{\"role\": ");
    CHECK_FALSE(load_config(broken, cfg, err));
    CHECK(err.find("broken.json") != std::string::npos);

    err.clear();
    auto bad_role = scratch("bad-role.json");
    write_file(bad_role, R"({"role":"phone","name":"x"})");
    CHECK_FALSE(load_config(bad_role, cfg, err));
    CHECK(err.find("role") != std::string::npos);
    CHECK(cfg.name == "cuelink");

    err.clear();
    auto bad_port = scratch("bad-port.json");
    write_file(bad_port, R"({"tunnel":{"port":70000}})");
    CHECK_FALSE(load_config(bad_port, cfg, err));
    CHECK(err.find("tunnel.port") != std::string::npos);
    CHECK(cfg.tunnel.port == 9360);
}

TEST_CASE("Cross-field checks reject impossible combinations") {
    std::string err;

    LinkConfig stale;
    stale.tunnel.stale_after_ms = 500;
    CHECK_FALSE(validate(stale, err));

    LinkConfig no_liveness;
    no_liveness.lan.stale_after_ms = 0;
    CHECK(validate(no_liveness, err));

    LinkConfig level;
    level.log_level = "chatty";
    CHECK_FALSE(validate(level, err));

    LinkConfig batch;
    CHECK_FALSE(apply_json(json{{"batch", {{"size", 0}}}}, batch, err));
    CHECK_FALSE(apply_json(json{{"batch", {{"size", 101}}}}, batch, err));
    CHECK_FALSE(apply_json(json{{"legacy_handshake", "yes"}}, batch, err));
}

TEST_CASE("Saved config loads back identically") {
    auto p = scratch("saved.json");
    LinkConfig cfg;
    cfg.role = DeploymentRole::Host;
    cfg.name = "Rig B";
    cfg.lan.discovery.beacon_interval_ms = 250;
    cfg.security.max_messages = 50;
    cfg.legacy_handshake = true;
    cfg.log_level = "debug";

    std::string err;
    REQUIRE(save_config(p, cfg, err));
    CHECK_FALSE(fs::exists(fs::path(p.string() + ".tmp")));

    LinkConfig back;
    REQUIRE(load_config(p, back, err));
    CHECK(to_json(back) == to_json(cfg));
}

TEST_CASE("Transport settings take the per-transport liveness values") {
    LinkConfig cfg;
    cfg.name = "Cue Bear";
    cfg.legacy_handshake = true;

    const auto t = tunnel_settings(cfg);
    CHECK(t.kind == TransportKind::Tunnel);
    CHECK(t.local_name == "Cue Bear");
    CHECK(t.heartbeat_interval_ms == 1000);
    CHECK(t.stale_after_ms == 3000);
    CHECK(t.bind_retry_ms == 5000);
    CHECK(t.legacy_handshake);

    const auto l = lan_settings(cfg);
    CHECK(l.kind == TransportKind::Lan);
    CHECK(l.heartbeat_interval_ms == 2000);
    CHECK(l.stale_after_ms == 30000);
    CHECK(l.handshake_timeout_ms == 3000);
}

TEST_CASE("Only the host role rate-limits its peers") {
    LinkConfig cfg;
    CHECK_FALSE(tunnel_settings(cfg).enforce_ingress_limits);
    CHECK_FALSE(lan_settings(cfg).enforce_ingress_limits);

    cfg.role = DeploymentRole::Host;
    CHECK(tunnel_settings(cfg).enforce_ingress_limits);
    CHECK(lan_settings(cfg).enforce_ingress_limits);
}
