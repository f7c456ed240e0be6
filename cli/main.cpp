/**
 * @file main.cpp
 * @brief cuelinkd: runs the Tunnel/LAN connection layer as a daemon.
 *
 * Responsibilities:
 *  - Load LinkConfig from XDG config (~/.config/cuelink/cuelink.json), then
 *    apply CLI11 overrides on top.
 *  - Wire socket sources by role:
 *      device: Tunnel listener on 127.0.0.1, LAN dialer (discovery or --lan-host)
 *      host:   Tunnel dialer to the forwarder, LAN listener + beacon advertiser
 *  - Run the Coordinator (one worker per transport) until SIGINT/SIGTERM.
 *  - Log inbound MIDI and status changes.
 *
 * Notes:
 *  - Config errors print `status=error reason=<...>` on stderr and exit 2
 *    before any socket is opened.
 *  - `--print-config` prints the effective config as JSON and exits.
 *  - `--write-config` persists the effective config to the --config path.
 */

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <utility>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "cuelink/clock.hpp"
#include "cuelink/config.hpp"
#include "cuelink/coordinator.hpp"
#include "cuelink/logging.hpp"
#include "cuelink/sinks.hpp"
#include "cuelink/transport/dialer_source.hpp"
#include "cuelink/transport/discovery.hpp"
#include "cuelink/transport/listener_source.hpp"
#include "cuelink/transport/tcp_stream.hpp"

using namespace cuelink;
namespace fs = std::filesystem;

// ---------- small utilities ----------

static Coordinator* g_coordinator = nullptr;

extern "C" void on_signal(int) {
  if (g_coordinator) g_coordinator->shutdown();
}

// Inbound MIDI goes to the log; a real engine would replace this sink.
class LoggingMidiSink : public MidiSink {
public:
  explicit LoggingMidiSink(Logger log) : log_(std::move(log)) {}

  void on_control_change(const CcMessage& cc) override {
    log_->info("midi cc ch={} cc={} value={} label='{}'", cc.channel, cc.number, cc.value, cc.label);
  }
  void on_note(const NoteMessage& n) override {
    log_->info("midi note ch={} note={} velocity={} label='{}'", n.channel, n.number, n.velocity,
               n.label);
  }
  void on_transport(const TransportMessage& t) override {
    log_->info("transport action={}", t.action);
  }
  void on_midi_input(const MidiInputMessage& m) override {
    log_->info("midi input {:02x} {:02x} {:02x}", m.status, m.data1, m.data2);
  }

private:
  Logger log_;
};

class LoggingStatusObserver : public StatusObserver {
public:
  explicit LoggingStatusObserver(Logger log) : log_(std::move(log)) {}
  void on_status(const LinkStatus& s) override {
    log_->info("status active={} quality={} peer='{}'", to_string(s.active), to_string(s.quality),
               s.peer_name);
  }

private:
  Logger log_;
};

static std::unique_ptr<transport::ISocketSource> make_tunnel_source(const LinkConfig& cfg,
                                                                    const std::string& dial_host,
                                                                    const Logger& log) {
  if (cfg.role == DeploymentRole::Device) {
    transport::ListenerConfig lc;
    lc.bind_host = "127.0.0.1";                     // reachable only through the USB mux
    lc.port      = cfg.tunnel.port;
    return std::make_unique<transport::TcpListenerSource>(TransportKind::Tunnel, lc, nullptr, log);
  }
  Endpoint fwd{TransportKind::Tunnel, dial_host, cfg.tunnel.port, "usb-forwarder"};
  return std::make_unique<transport::TcpDialerSource>(
      TransportKind::Tunnel, std::make_shared<transport::StaticEndpoint>(fwd),
      transport::DialerConfig{}, log);
}

static std::unique_ptr<transport::ISocketSource> make_lan_source(const LinkConfig& cfg,
                                                                 const std::string& dial_host,
                                                                 const Logger& log) {
  if (cfg.role == DeploymentRole::Host) {
    transport::ListenerConfig lc;
    lc.bind_host = cfg.lan.bind_host;
    lc.port      = cfg.lan.port;
    auto adv = std::make_unique<transport::ServiceAdvertiser>(cfg.lan.discovery, cfg.name,
                                                              cfg.lan.port, log);
    return std::make_unique<transport::TcpListenerSource>(TransportKind::Lan, lc, std::move(adv),
                                                          log);
  }
  std::shared_ptr<transport::EndpointProvider> provider;
  if (!cfg.lan.static_host.empty()) {
    provider = std::make_shared<transport::StaticEndpoint>(
        Endpoint{TransportKind::Lan, dial_host, cfg.lan.port, cfg.lan.static_host});
  } else {
    provider = std::make_shared<transport::ServiceBrowser>(cfg.lan.discovery, TransportKind::Lan, log);
  }
  return std::make_unique<transport::TcpDialerSource>(TransportKind::Lan, std::move(provider),
                                                      transport::DialerConfig{}, log);
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_role;
  std::string opt_name;
  uint16_t    opt_tunnel_port = 0;
  uint16_t    opt_lan_port = 0;
  std::string opt_lan_host;
  bool        opt_legacy = false;
  std::string opt_log_level;
  bool        opt_print_config = false;
  bool        opt_write_config = false;

  CLI::App app{"cuelinkd - touch controller <-> music host connection daemon"};

  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/cuelink/cuelink.json)");
  app.add_option("--role", opt_role, "Deployment role: device|host")->check(CLI::IsMember({"device", "host"}));
  app.add_option("--name", opt_name, "Display name sent in the handshake / beacon");
  app.add_option("--tunnel-port", opt_tunnel_port, "Tunnel port")->check(CLI::Range(uint16_t{1}, std::numeric_limits<uint16_t>::max()));
  app.add_option("--lan-port", opt_lan_port, "LAN port")->check(CLI::Range(uint16_t{1}, std::numeric_limits<uint16_t>::max()));
  app.add_option("--lan-host", opt_lan_host, "Dial this LAN host instead of discovering one");
  app.add_flag("--legacy-handshake", opt_legacy, "Initiate with CB/1 HELLO");
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|critical|off");
  app.add_flag("--print-config", opt_print_config, "Print the effective config as JSON and exit");
  app.add_flag("--write-config", opt_write_config, "Save the effective config to --config and exit");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  // Resolve config: defaults <- file <- flags
  const fs::path cfg_path = opt_config.empty() ? default_config_path() : fs::path(opt_config);
  LinkConfig cfg;
  std::string err;
  if (!load_config(cfg_path, cfg, err)) {
    std::cerr << "status=error reason=config " << err << "\n";
    return 2;
  }
  if (!opt_role.empty())      cfg.role = opt_role == "host" ? DeploymentRole::Host : DeploymentRole::Device;
  if (!opt_name.empty())      cfg.name = opt_name;
  if (opt_tunnel_port)        cfg.tunnel.port = opt_tunnel_port;
  if (opt_lan_port)           cfg.lan.port = opt_lan_port;
  if (!opt_lan_host.empty())  cfg.lan.static_host = opt_lan_host;
  if (opt_legacy)             cfg.legacy_handshake = true;
  if (!opt_log_level.empty()) cfg.log_level = opt_log_level;
  if (!validate(cfg, err)) {
    std::cerr << "status=error reason=config " << err << "\n";
    return 2;
  }

  if (opt_print_config) {
    std::cout << to_json(cfg).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    return 0;
  }
  if (opt_write_config) {
    if (!save_config(cfg_path, cfg, err)) {
      std::cerr << "status=error reason=config " << err << "\n";
      return 2;
    }
    std::cout << "status=ok config=" << cfg_path.string() << "\n";
    return 0;
  }

  // Names are resolved once here; the dialers only accept numeric hosts.
  std::string dial_host;
  if (cfg.role == DeploymentRole::Host) {
    if (!transport::net::resolve_host(cfg.tunnel.host, dial_host, err)) {
      std::cerr << "status=error reason=resolve " << err << "\n";
      return 2;
    }
  } else if (!cfg.lan.static_host.empty()) {
    if (!transport::net::resolve_host(cfg.lan.static_host, dial_host, err)) {
      std::cerr << "status=error reason=resolve " << err << "\n";
      return 2;
    }
  }

  Logger log = make_logger("cuelink", *parse_level(cfg.log_level));
  log->info("cuelinkd starting: role={} name='{}' tunnel={} lan={}", to_string(cfg.role), cfg.name,
            cfg.tunnel.port, cfg.lan.port);

  SteadyClock clock;
  LoggingMidiSink sink(log);
  LoggingStatusObserver observer(log);

  Coordinator coord(tunnel_settings(cfg), make_tunnel_source(cfg, dial_host, log),
                    lan_settings(cfg), make_lan_source(cfg, dial_host, log),
                    cfg.security, clock, &sink, log);
  coord.set_status_observer(&observer);

  g_coordinator = &coord;
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
#ifdef SIGPIPE
  std::signal(SIGPIPE, SIG_IGN);
#endif

  coord.run();

  g_coordinator = nullptr;
  log->info("cuelinkd stopped: {} send(s) dropped without a session", coord.dropped_sends());
  return 0;
}
