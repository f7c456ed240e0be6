// -----------------------------------------------------------------------------
// config.cpp — LinkConfig JSON load/save, validation, transport settings
//
// File layout and defaults:
//   see include/cuelink/config.hpp
// -----------------------------------------------------------------------------
#include "cuelink/config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

#include "cuelink/logging.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace cuelink {

const char* to_string(DeploymentRole r) {
  return r == DeploymentRole::Device ? "device" : "host";
}

fs::path default_config_path() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg)
                                : fs::path(home && *home ? home : ".") / ".config";
  return base / "cuelink" / "cuelink.json";
}

namespace {

// read_uint(): optional key; present means integer within [lo, hi].
template <typename T>
bool read_uint(const json& j, const char* key, T& out, uint64_t lo, uint64_t hi,
               const std::string& where, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) {
    err = where + key + ": expected an integer";
    return false;
  }
  const int64_t v = it->get<int64_t>();
  if (v < 0 || static_cast<uint64_t>(v) < lo || static_cast<uint64_t>(v) > hi) {
    err = where + key + ": " + std::to_string(v) + " outside [" + std::to_string(lo) + ", " +
          std::to_string(hi) + "]";
    return false;
  }
  out = static_cast<T>(v);
  return true;
}

bool read_string(const json& j, const char* key, std::string& out, const std::string& where,
                 std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) {
    err = where + key + ": expected a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_bool(const json& j, const char* key, bool& out, const std::string& where,
               std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_boolean()) {
    err = where + key + ": expected true/false";
    return false;
  }
  out = it->get<bool>();
  return true;
}

// section(): optional nested object.
const json* section(const json& j, const char* key, const std::string& where, std::string& err,
                    bool& ok) {
  ok = true;
  auto it = j.find(key);
  if (it == j.end()) return nullptr;
  if (!it->is_object()) {
    err = where + key + ": expected an object";
    ok  = false;
    return nullptr;
  }
  return &*it;
}

constexpr uint64_t U16 = std::numeric_limits<uint16_t>::max();
constexpr uint64_t U32 = std::numeric_limits<uint32_t>::max();

} // namespace

bool apply_json(const json& j, LinkConfig& cfg, std::string& err) {
  if (!j.is_object()) {
    err = "config: top level must be an object";
    return false;
  }

  std::string role = to_string(cfg.role);
  if (!read_string(j, "role", role, "", err)) return false;
  if (role == "device") {
    cfg.role = DeploymentRole::Device;
  } else if (role == "host") {
    cfg.role = DeploymentRole::Host;
  } else {
    err = "role: '" + role + "' is not device|host";
    return false;
  }

  if (!read_string(j, "name", cfg.name, "", err)) return false;
  if (!read_uint(j, "handshake_timeout_ms", cfg.handshake_timeout_ms, 1, U32, "", err)) return false;
  if (!read_uint(j, "bind_retry_ms", cfg.bind_retry_ms, 1, U32, "", err)) return false;
  if (!read_bool(j, "legacy_handshake", cfg.legacy_handshake, "", err)) return false;
  if (!read_string(j, "log_level", cfg.log_level, "", err)) return false;

  bool ok = true;
  if (const json* t = section(j, "tunnel", "", err, ok)) {
    const std::string w = "tunnel.";
    if (!read_string(*t, "host", cfg.tunnel.host, w, err)) return false;
    if (!read_uint(*t, "port", cfg.tunnel.port, 1, U16, w, err)) return false;
    if (!read_uint(*t, "heartbeat_ms", cfg.tunnel.heartbeat_interval_ms, 0, U32, w, err)) return false;
    if (!read_uint(*t, "stale_ms", cfg.tunnel.stale_after_ms, 0, U32, w, err)) return false;
  }
  if (!ok) return false;

  if (const json* l = section(j, "lan", "", err, ok)) {
    const std::string w = "lan.";
    if (!read_uint(*l, "port", cfg.lan.port, 1, U16, w, err)) return false;
    if (!read_string(*l, "bind_host", cfg.lan.bind_host, w, err)) return false;
    if (!read_string(*l, "static_host", cfg.lan.static_host, w, err)) return false;
    if (!read_uint(*l, "heartbeat_ms", cfg.lan.heartbeat_interval_ms, 0, U32, w, err)) return false;
    if (!read_uint(*l, "stale_ms", cfg.lan.stale_after_ms, 0, U32, w, err)) return false;

    if (const json* d = section(*l, "discovery", w, err, ok)) {
      const std::string wd = "lan.discovery.";
      auto& dc = cfg.lan.discovery;
      if (!read_string(*d, "group", dc.group, wd, err)) return false;
      if (!read_uint(*d, "port", dc.port, 1, U16, wd, err)) return false;
      if (!read_string(*d, "service", dc.service, wd, err)) return false;
      if (!read_uint(*d, "beacon_ms", dc.beacon_interval_ms, 1, U32, wd, err)) return false;
      if (!read_uint(*d, "ttl_s", dc.ttl_s, 1, U32, wd, err)) return false;
    }
    if (!ok) return false;
  }
  if (!ok) return false;

  if (const json* b = section(j, "batch", "", err, ok)) {
    const std::string w = "batch.";
    if (!read_uint(*b, "size", cfg.batch.batch_size, 1, OutgoingBatch::MAX_BATCH_SIZE, w, err)) return false;
    if (!read_uint(*b, "timeout_ms", cfg.batch.batch_timeout_ms, 0, U32, w, err)) return false;
  }
  if (!ok) return false;

  if (const json* s = section(j, "security", "", err, ok)) {
    const std::string w = "security.";
    auto& sl = cfg.security;
    if (!read_uint(*s, "max_connections", sl.max_connection_attempts, 1, SecurityGate::MAX_ATTEMPT_SLOTS, w, err)) return false;
    if (!read_uint(*s, "connection_window_ms", sl.connection_window_ms, 1, U32, w, err)) return false;
    if (!read_uint(*s, "max_messages", sl.max_messages, 1, SecurityGate::MAX_MESSAGE_SLOTS, w, err)) return false;
    if (!read_uint(*s, "message_window_ms", sl.message_window_ms, 1, U32, w, err)) return false;
    if (!read_uint(*s, "max_batch", sl.max_batch_entries, 1, OutgoingBatch::MAX_BATCH_SIZE, w, err)) return false;
  }
  if (!ok) return false;

  return validate(cfg, err);
}

bool validate(const LinkConfig& cfg, std::string& err) {
  if (cfg.name.empty()) {
    err = "name: must not be empty";
    return false;
  }
  if (cfg.tunnel.port == 0 || cfg.lan.port == 0) {
    err = "port: 0 is not a valid port";
    return false;
  }
  if (cfg.tunnel.host.empty()) {
    err = "tunnel.host: must not be empty";
    return false;
  }
  if (cfg.tunnel.stale_after_ms != 0 && cfg.tunnel.stale_after_ms <= cfg.tunnel.heartbeat_interval_ms) {
    err = "tunnel.stale_ms: must exceed tunnel.heartbeat_ms";
    return false;
  }
  if (cfg.lan.stale_after_ms != 0 && cfg.lan.stale_after_ms <= cfg.lan.heartbeat_interval_ms) {
    err = "lan.stale_ms: must exceed lan.heartbeat_ms";
    return false;
  }
  if (cfg.batch.batch_size == 0 || cfg.batch.batch_size > OutgoingBatch::MAX_BATCH_SIZE) {
    err = "batch.size: must be 1.." + std::to_string(OutgoingBatch::MAX_BATCH_SIZE);
    return false;
  }
  if (!parse_level(cfg.log_level)) {
    err = "log_level: '" + cfg.log_level + "' is not a log level";
    return false;
  }
  return true;
}

json to_json(const LinkConfig& cfg) {
  const auto& dc = cfg.lan.discovery;
  const auto& sl = cfg.security;
  return json{
    {"role", to_string(cfg.role)},
    {"name", cfg.name},
    {"tunnel", {{"host", cfg.tunnel.host},
                {"port", cfg.tunnel.port},
                {"heartbeat_ms", cfg.tunnel.heartbeat_interval_ms},
                {"stale_ms", cfg.tunnel.stale_after_ms}}},
    {"lan", {{"port", cfg.lan.port},
             {"bind_host", cfg.lan.bind_host},
             {"static_host", cfg.lan.static_host},
             {"heartbeat_ms", cfg.lan.heartbeat_interval_ms},
             {"stale_ms", cfg.lan.stale_after_ms},
             {"discovery", {{"group", dc.group},
                            {"port", dc.port},
                            {"service", dc.service},
                            {"beacon_ms", dc.beacon_interval_ms},
                            {"ttl_s", dc.ttl_s}}}}},
    {"batch", {{"size", cfg.batch.batch_size}, {"timeout_ms", cfg.batch.batch_timeout_ms}}},
    {"security", {{"max_connections", sl.max_connection_attempts},
                  {"connection_window_ms", sl.connection_window_ms},
                  {"max_messages", sl.max_messages},
                  {"message_window_ms", sl.message_window_ms},
                  {"max_batch", sl.max_batch_entries}}},
    {"handshake_timeout_ms", cfg.handshake_timeout_ms},
    {"bind_retry_ms", cfg.bind_retry_ms},
    {"legacy_handshake", cfg.legacy_handshake},
    {"log_level", cfg.log_level},
  };
}

bool load_config(const fs::path& path, LinkConfig& out, std::string& err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;         // defaults

  std::ifstream in(path);
  if (!in) {
    err = path.string() + ": cannot open";
    return false;
  }
  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    err = path.string() + ": " + e.what();
    return false;
  }

  LinkConfig cfg = out;
  if (!apply_json(j, cfg, err)) {
    err = path.string() + ": " + err;
    return false;
  }
  out = std::move(cfg);
  return true;
}

// save_config(): write to <path>.tmp, then rename over the target.
bool save_config(const fs::path& path, const LinkConfig& cfg, std::string& err) {
  std::error_code ec;
  if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);
  if (ec) {
    err = path.parent_path().string() + ": " + ec.message();
    return false;
  }
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream o(tmp, std::ios::trunc);
    if (!o) {
      err = tmp.string() + ": cannot write";
      return false;
    }
    o << to_json(cfg).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    if (!o) {
      err = tmp.string() + ": write failed";
      return false;
    }
  }
  fs::rename(tmp, path, ec);
  if (ec) {
    err = path.string() + ": " + ec.message();
    return false;
  }
  return true;
}

TransportSettings tunnel_settings(const LinkConfig& cfg) {
  TransportSettings s;
  s.kind                  = TransportKind::Tunnel;
  s.local_name            = cfg.name;
  s.handshake_timeout_ms  = cfg.handshake_timeout_ms;
  s.heartbeat_interval_ms = cfg.tunnel.heartbeat_interval_ms;
  s.stale_after_ms        = cfg.tunnel.stale_after_ms;
  s.bind_retry_ms         = cfg.bind_retry_ms;
  s.batch                 = cfg.batch;
  s.legacy_handshake      = cfg.legacy_handshake;
  // POLICY: only the host rate-limits; a device must take every host frame
  s.enforce_ingress_limits = cfg.role == DeploymentRole::Host;
  return s;
}

TransportSettings lan_settings(const LinkConfig& cfg) {
  TransportSettings s = tunnel_settings(cfg);
  s.kind                  = TransportKind::Lan;
  s.heartbeat_interval_ms = cfg.lan.heartbeat_interval_ms;
  s.stale_after_ms        = cfg.lan.stale_after_ms;
  return s;
}

} // namespace cuelink
