// -----------------------------------------------------------------------------
// coordinator.cpp — Coordinator (Tunnel/LAN arbitration, routing, status)
//
// Arbitration table:
//   see include/cuelink/coordinator.hpp
//
// Lock order: mu_ only. Transport methods called under mu_ only post to the
// transport's mailbox, so they never call back into the coordinator.
// -----------------------------------------------------------------------------
#include "cuelink/coordinator.hpp"

#include <chrono>
#include <utility>

namespace cuelink {

const char* to_string(ActiveTransport a) {
  switch (a) {
    case ActiveTransport::None:   return "none";
    case ActiveTransport::Tunnel: return "tunnel";
    case ActiveTransport::Lan:    return "lan";
  }
  return "unknown";
}

Coordinator::Coordinator(TransportSettings tunnel_settings,
                         std::unique_ptr<transport::ISocketSource> tunnel_source,
                         TransportSettings lan_settings,
                         std::unique_ptr<transport::ISocketSource> lan_source,
                         SecurityLimits limits,
                         const Clock& clock,
                         MidiSink* sink,
                         Logger log,
                         CoordinatorSettings settings)
: settings_(settings),
  clock_(clock),
  log_(or_null(std::move(log))),
  gate_(limits, log_),
  sink_(sink) {
  tunnel_settings.kind = TransportKind::Tunnel;
  lan_settings.kind    = TransportKind::Lan;
  tunnel_ = std::make_unique<Transport>(std::move(tunnel_settings), std::move(tunnel_source),
                                        clock_, gate_, log_);
  lan_    = std::make_unique<Transport>(std::move(lan_settings), std::move(lan_source),
                                        clock_, gate_, log_);

  auto handler = [this](TransportKind kind, const Message& m) { dispatch_inbound(kind, m); };
  tunnel_->set_inbound_handler(handler);
  lan_->set_inbound_handler(handler);

  last_gc_ms_     = clock_.now_ms();
  last_health_ms_ = last_gc_ms_;
}

Coordinator::~Coordinator() {
  stop_workers();
}

// ---------- lifecycle ----------

void Coordinator::start() {
  std::lock_guard<std::mutex> lock(mu_);
  started_     = true;
  lan_parked_  = false;
  tunnel_held_ = false;
  manual_lan_  = false;
  tunnel_->start();
  lan_->start();
  log_->info("coordinator: started (tunnel {}, lan {})", to_string(tunnel_->role()),
             to_string(lan_->role()));
}

void Coordinator::stop() {
  std::lock_guard<std::mutex> lock(mu_);
  started_     = false;
  lan_parked_  = false;
  tunnel_held_ = false;
  manual_lan_  = false;
  active_      = ActiveTransport::None;
  tunnel_->stop();
  lan_->stop();
  log_->info("coordinator: stopped");
}

void Coordinator::force_recovery() {
  std::lock_guard<std::mutex> lock(mu_);
  log_->warn("coordinator: forced recovery, restarting both transports");
  started_     = true;
  lan_parked_  = false;
  tunnel_held_ = false;
  manual_lan_  = false;
  active_      = ActiveTransport::None;
  tunnel_->stop();
  lan_->stop();
  tunnel_->start();
  lan_->start();
}

// tick(): the coordinator cycle. Events are applied in publication order per transport.
void Coordinator::tick() {
  const uint64_t now = clock_.now_ms();
  LinkStatus snapshot;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    TransportEvent e;
    while (tunnel_->poll_event(e)) on_tunnel_event(e);
    while (lan_->poll_event(e)) on_lan_event(e);

    if (now - last_health_ms_ >= settings_.health_check_ms) {
      last_health_ms_ = now;
      health_check();
    }

    snapshot = compute_status();
    if (snapshot != last_status_) {
      last_status_ = snapshot;
      changed      = true;
    }
  }

  if (now - last_gc_ms_ >= settings_.gc_interval_ms) {
    last_gc_ms_ = now;
    gate_.collect_garbage(now);
  }

  if (changed) {
    log_->info("coordinator: status active={} quality={} peer='{}'", to_string(snapshot.active),
               to_string(snapshot.quality), snapshot.peer_name);
    if (observer_) observer_->on_status(snapshot);
  }
}

void Coordinator::poll_once() {
  tunnel_->poll();
  lan_->poll();
  tick();
}

void Coordinator::run() {
  running_.store(true);
  start_workers();
  start();
  const auto nap = std::chrono::milliseconds(settings_.poll_interval_ms);
  while (running_.load()) {
    tick();
    std::this_thread::sleep_for(nap);
  }
  stop();
  stop_workers();
  tick();                                         // report the final state
}

void Coordinator::start_workers() {
  if (workers_running_.exchange(true)) return;
  const auto nap = std::chrono::milliseconds(settings_.poll_interval_ms);
  auto loop = [this, nap](Transport* t) {
    while (workers_running_.load()) {
      t->poll();
      std::this_thread::sleep_for(nap);
    }
    t->poll();                                    // drain a final stop()
  };
  tunnel_worker_ = std::thread(loop, tunnel_.get());
  lan_worker_    = std::thread(loop, lan_.get());
}

void Coordinator::stop_workers() {
  workers_running_.store(false);
  if (tunnel_worker_.joinable()) tunnel_worker_.join();
  if (lan_worker_.joinable()) lan_worker_.join();
}

// ---------- arbitration (mu_ held) ----------

void Coordinator::on_tunnel_event(const TransportEvent& e) {
  switch (e.state) {
    case LinkState::Active:
      if (tunnel_held_) {
        log_->debug("coordinator: tunnel conn={} active while held, ignored", e.conn_id);
        break;
      }
      if (active_ == ActiveTransport::Lan) {
        log_->info("coordinator: tunnel preempts lan session with '{}'", lan_peer_);
      }
      active_      = ActiveTransport::Tunnel;
      tunnel_peer_ = e.peer_name;
      if (!lan_parked_) {
        lan_->stop();
        lan_parked_ = true;
      }
      break;

    case LinkState::Disconnected: {
      if (active_ == ActiveTransport::Tunnel) active_ = ActiveTransport::None;
      tunnel_peer_.clear();
      if (e.reason == DisconnectReason::User) break;   // our own stop()
      if (lan_->is_active() && !lan_parked_) {
        log_->info("coordinator: tunnel dropped ({}) while lan active, holding tunnel",
                   to_string(e.reason));
        tunnel_->stop();
        tunnel_held_ = true;
      } else if (lan_parked_) {
        log_->info("coordinator: tunnel dropped ({}), resuming lan", to_string(e.reason));
        unpark_lan();
      }
      break;
    }

    default:
      break;
  }
}

void Coordinator::on_lan_event(const TransportEvent& e) {
  switch (e.state) {
    case LinkState::Active:
      if (lan_parked_) break;                     // stop already queued
      if (active_ == ActiveTransport::Tunnel && tunnel_->is_active()) {
        log_->info("coordinator: lan conn={} active behind tunnel, parking lan", e.conn_id);
        lan_->stop();
        lan_parked_ = true;
        break;
      }
      active_   = ActiveTransport::Lan;
      lan_peer_ = e.peer_name;
      break;

    case LinkState::Disconnected: {
      const bool was_active = active_ == ActiveTransport::Lan;
      if (was_active) active_ = ActiveTransport::None;
      lan_peer_.clear();
      if (e.reason == DisconnectReason::User) break;
      if (manual_lan_ && was_active) {
        log_->info("coordinator: manual lan session ended ({})", to_string(e.reason));
        manual_lan_ = false;
      }
      if (tunnel_held_ && !manual_lan_) release_tunnel();
      break;
    }

    default:
      break;
  }
}

void Coordinator::release_tunnel() {
  tunnel_held_ = false;
  if (!started_) return;
  log_->info("coordinator: releasing tunnel");
  tunnel_->start();
}

void Coordinator::unpark_lan() {
  lan_parked_ = false;
  if (!started_) return;
  lan_->start();
}

// health_check(): nothing active: undo holds whose reason is gone.
void Coordinator::health_check() {
  if (!started_ || active_ != ActiveTransport::None) return;
  if (lan_parked_ && !tunnel_->is_active()) {
    log_->warn("coordinator: lan parked with no tunnel session, resuming lan");
    unpark_lan();
  }
  if (tunnel_held_ && !manual_lan_ && !lan_->is_active()) {
    log_->warn("coordinator: tunnel held with no lan session, releasing");
    release_tunnel();
  }
}

LinkStatus Coordinator::compute_status() const {
  LinkStatus s;
  s.active = active_;
  switch (active_) {
    case ActiveTransport::Tunnel:
      s.quality   = tunnel_->quality();
      s.peer_name = tunnel_peer_;
      break;
    case ActiveTransport::Lan:
      s.quality   = lan_->quality();
      s.peer_name = lan_peer_;
      break;
    case ActiveTransport::None:
      s.quality = (tunnel_->quality() == LinkQuality::Connecting ||
                   lan_->quality() == LinkQuality::Connecting)
                      ? LinkQuality::Connecting
                      : LinkQuality::Disconnected;
      break;
  }
  return s;
}

// ---------- manual LAN ----------

bool Coordinator::connect_lan(const Endpoint& ep) {
  if (lan_->role() != Role::Initiator) {
    log_->warn("coordinator: lan side only accepts connections, cannot dial {}", ep.address());
    return false;
  }
  std::lock_guard<std::mutex> lock(mu_);
  log_->info("coordinator: manual lan connect to {} ({})", ep.address(), ep.name);
  manual_lan_ = true;
  started_    = true;
  if (!tunnel_held_) {
    tunnel_->stop();
    tunnel_held_ = true;
  }
  lan_parked_ = false;
  gate_.clear(SecurityGate::fingerprint(TransportKind::Lan, ep.host));
  Endpoint target = ep;
  target.kind = TransportKind::Lan;
  lan_->retarget(target);
  lan_->start();
  return true;
}

void Coordinator::disconnect_lan() {
  std::lock_guard<std::mutex> lock(mu_);
  log_->info("coordinator: manual lan disconnect");
  manual_lan_ = false;
  if (lan_->role() == Role::Initiator) lan_->retarget(std::nullopt);
  if (tunnel_held_) release_tunnel();
}

void Coordinator::peer_available(TransportKind kind) {
  if (kind == TransportKind::Tunnel) {
    tunnel_->peer_available();
  } else {
    lan_->peer_available();
  }
}

void Coordinator::on_device_attached() {
  log_->info("coordinator: device attached");
  tunnel_->peer_available();
}

void Coordinator::on_device_detached() {
  log_->info("coordinator: device detached");   // the tunnel notices through its socket
}

// ---------- send ----------

bool Coordinator::send(Message m) {
  const char* what = type_name(kind_of(m));
  ActiveTransport target;
  {
    std::lock_guard<std::mutex> lock(mu_);
    target = active_;
  }

  bool ok = false;
  switch (target) {
    case ActiveTransport::Tunnel: ok = tunnel_->send(std::move(m)); break;
    case ActiveTransport::Lan:    ok = lan_->send(std::move(m)); break;
    case ActiveTransport::None:
      if (tunnel_->is_active()) {
        ok = tunnel_->send(std::move(m));
      } else if (lan_->is_active()) {
        ok = lan_->send(std::move(m));
      }
      break;
  }
  if (!ok) {
    ++dropped_;
    log_->debug("coordinator: no active transport, {} dropped", what);
  }
  return ok;
}

bool Coordinator::send_cc(int channel, int number, int value, std::string label,
                          std::string button_id) {
  auto cc = make_cc(channel, number, value, std::move(label), std::move(button_id));
  if (!cc) {
    log_->warn("coordinator: cc ch={} cc={} value={} out of range", channel, number, value);
    return false;
  }
  return send(Message{std::move(*cc)});
}

bool Coordinator::send_note(int channel, int number, int velocity, std::string label,
                            std::string button_id) {
  auto note = make_note(channel, number, velocity, std::move(label), std::move(button_id));
  if (!note) {
    log_->warn("coordinator: note ch={} note={} velocity={} out of range", channel, number,
               velocity);
    return false;
  }
  return send(Message{std::move(*note)});
}

bool Coordinator::send_transport(const std::string& action) {
  auto t = make_transport(action, clock_.epoch_seconds());
  if (!t) {
    log_->warn("coordinator: empty transport action");
    return false;
  }
  return send(Message{std::move(*t)});
}

bool Coordinator::send_midi_input(int status, int data1, int data2) {
  auto m = make_midi_input(status, data1, data2);
  if (!m) {
    log_->warn("coordinator: midi input {:#04x} {} {} out of range", status, data1, data2);
    return false;
  }
  return send(Message{*m});
}

// dispatch_inbound(): runs on the delivering transport's I/O context.
void Coordinator::dispatch_inbound(TransportKind kind, const Message& m) {
  if (!sink_) return;
  switch (kind_of(m)) {
    case MessageKind::Cc:            sink_->on_control_change(std::get<CcMessage>(m)); break;
    case MessageKind::Note:          sink_->on_note(std::get<NoteMessage>(m)); break;
    case MessageKind::Transport:     sink_->on_transport(std::get<TransportMessage>(m)); break;
    case MessageKind::MidiInput:     sink_->on_midi_input(std::get<MidiInputMessage>(m)); break;
    default:
      log_->debug("{}: {} not routed to the midi sink", to_string(kind), type_name(kind_of(m)));
      break;
  }
}

// ---------- inspection ----------

LinkStatus Coordinator::status() const {
  std::lock_guard<std::mutex> lock(mu_);
  return compute_status();
}

ActiveTransport Coordinator::active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

bool Coordinator::tunnel_held() const {
  std::lock_guard<std::mutex> lock(mu_);
  return tunnel_held_;
}

bool Coordinator::lan_parked() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lan_parked_;
}

bool Coordinator::manual_lan() const {
  std::lock_guard<std::mutex> lock(mu_);
  return manual_lan_;
}

} // namespace cuelink
