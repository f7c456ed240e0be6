#pragma once
/**
 * @file config.hpp
 * @brief LinkConfig: every tunable of the connection layer, JSON-backed.
 *
 * @details
 * ## File
 * `$XDG_CONFIG_HOME/cuelink/cuelink.json` (fallback `~/.config/cuelink/cuelink.json`).
 * A missing file means defaults. Unknown keys are ignored. A key that is
 * present with the wrong type or an out-of-range value fails the load.
 *
 * ```json
 * {
 *   "role": "device",
 *   "name": "Cue Bear",
 *   "tunnel": { "host": "127.0.0.1", "port": 9360, "heartbeat_ms": 1000, "stale_ms": 3000 },
 *   "lan":    { "port": 9361, "bind_host": "0.0.0.0", "static_host": "",
 *               "heartbeat_ms": 2000, "stale_ms": 30000,
 *               "discovery": { "group": "239.255.42.99", "port": 9362,
 *                              "service": "_cuebear._tcp", "beacon_ms": 1000, "ttl_s": 5 } },
 *   "batch":    { "size": 5, "timeout_ms": 10 },
 *   "security": { "max_connections": 20, "connection_window_ms": 60000,
 *                 "max_messages": 100, "message_window_ms": 1000, "max_batch": 50 },
 *   "handshake_timeout_ms": 3000,
 *   "bind_retry_ms": 5000,
 *   "legacy_handshake": false,
 *   "log_level": "info"
 * }
 * ```
 *
 * ## Roles
 * - device: Tunnel listens on 127.0.0.1, LAN dials (discovery or static_host).
 * - host:   Tunnel dials the forwarder on tunnel.host, LAN listens and advertises.
 */

#include <cstdint>
#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"

#include "cuelink/framer.hpp"
#include "cuelink/security_gate.hpp"
#include "cuelink/transport.hpp"
#include "cuelink/transport/discovery.hpp"

namespace cuelink {

enum class DeploymentRole : uint8_t { Device, Host };

const char* to_string(DeploymentRole r);

struct TunnelConfig {
  std::string host{"127.0.0.1"};
  uint16_t    port{9360};
  uint32_t    heartbeat_interval_ms{1000};
  uint32_t    stale_after_ms{3000};
};

struct LanConfig {
  uint16_t    port{9361};
  std::string bind_host{"0.0.0.0"};
  std::string static_host;                  ///< non-empty: dial this, skip discovery
  uint32_t    heartbeat_interval_ms{2000};
  uint32_t    stale_after_ms{30000};
  transport::DiscoveryConfig discovery;
};

struct LinkConfig {
  DeploymentRole role{DeploymentRole::Device};
  std::string    name{"cuelink"};
  TunnelConfig   tunnel;
  LanConfig      lan;
  BatchPolicy    batch;
  SecurityLimits security;
  uint32_t       handshake_timeout_ms{3000};
  uint32_t       bind_retry_ms{5000};
  bool           legacy_handshake{false};
  std::string    log_level{"info"};
};

std::filesystem::path default_config_path();

/**
 * @brief Load `path` over the defaults already in `out`.
 * @return false with `err` set on unreadable JSON or invalid values. A
 *         missing file is not an error.
 */
bool load_config(const std::filesystem::path& path, LinkConfig& out, std::string& err);
bool save_config(const std::filesystem::path& path, const LinkConfig& cfg, std::string& err);

nlohmann::json to_json(const LinkConfig& cfg);
bool apply_json(const nlohmann::json& j, LinkConfig& cfg, std::string& err);
/// Cross-field checks (ports, thresholds, limits). Run after CLI overrides too.
bool validate(const LinkConfig& cfg, std::string& err);

TransportSettings tunnel_settings(const LinkConfig& cfg);
TransportSettings lan_settings(const LinkConfig& cfg);

} // namespace cuelink
