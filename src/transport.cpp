// -----------------------------------------------------------------------------
// transport.cpp — generic Transport (FSM driver, handshake, framing, liveness)
//
// API & operational model:
//   see include/cuelink/transport.hpp
//
// NOTE: everything below `poll()` runs on the owning I/O context. The only
// members touched from other threads are the mailbox, the published event
// queue and the two atomics (state_, quality_).
// -----------------------------------------------------------------------------
#include "cuelink/transport.hpp"

#include <utility>
#include <vector>

#include "cuelink/handshake.hpp"

namespace cuelink {

namespace {
std::atomic<uint64_t> g_next_conn_id{1};   // process-wide, never reused
} // namespace

Transport::Transport(TransportSettings settings,
                     std::unique_ptr<transport::ISocketSource> source,
                     const Clock& clock,
                     SecurityGate& gate,
                     Logger log)
: settings_(std::move(settings)),
  source_(std::move(source)),
  clock_(clock),
  gate_(gate),
  log_(or_null(std::move(log))),
  role_(source_->role()),
  fsm_(source_->waiting_state()),
  splitter_(settings_.max_line_bytes),
  batch_(settings_.batch),
  heartbeat_(settings_.heartbeat_interval_ms, settings_.stale_after_ms) {}

Transport::~Transport() {
  if (stream_) stream_->close();
  source_->close();
}

// ---------- any thread ----------

bool Transport::push_command(Command c) {
  std::lock_guard<std::mutex> lock(mailbox_mu_);
  if (mailbox_.size() >= MAILBOX_CAP) return false;
  mailbox_.push_back(std::move(c));
  return true;
}

void Transport::start() {
  Command c; c.kind = Command::Kind::Start;
  push_command(std::move(c));
}

void Transport::stop() {
  Command c; c.kind = Command::Kind::Stop;
  push_command(std::move(c));
}

bool Transport::send(Message m) {
  if (!is_active()) return false;                 // no session: caller decides, nothing is queued
  Command c;
  c.kind = Command::Kind::Send;
  c.msg  = std::move(m);
  return push_command(std::move(c));
}

void Transport::peer_available() {
  Command c; c.kind = Command::Kind::PeerAvailable;
  push_command(std::move(c));
}

void Transport::retarget(std::optional<Endpoint> ep) {
  Command c;
  c.kind   = Command::Kind::Retarget;
  c.target = std::move(ep);
  push_command(std::move(c));
}

bool Transport::poll_event(TransportEvent& out) {
  std::lock_guard<std::mutex> lock(events_mu_);
  if (published_.empty()) return false;
  out = std::move(published_.front());
  published_.pop_front();
  return true;
}

// ---------- I/O context ----------

void Transport::poll() {
  const uint64_t now = clock_.now_ms();

  drain_mailbox(now);
  pump(now);

  service_source(now);
  pump(now);

  if (stream_) read_input(now);
  pump(now);

  check_timers(now);
  pump(now);

  if (fsm_.state() == LinkState::Active) {
    flush_if_due(now);
    write_pending(now);
    pump(now);
  }

  switch (fsm_.state()) {
    case LinkState::Active:
      quality_ = heartbeat_.quality(now);
      break;
    case LinkState::Connecting:
    case LinkState::AwaitingHandshake:
      quality_ = LinkQuality::Connecting;
      break;
    default:
      quality_ = LinkQuality::Disconnected;
      break;
  }
}

void Transport::drain_mailbox(uint64_t now) {
  std::deque<Command> work;
  {
    std::lock_guard<std::mutex> lock(mailbox_mu_);
    work.swap(mailbox_);
  }

  for (auto& c : work) {
    switch (c.kind) {
      case Command::Kind::Start:
        raise(LinkEvent::Start);
        pump(now);
        break;
      case Command::Kind::Stop:
        raise(LinkEvent::Stop);
        pump(now);
        break;
      case Command::Kind::PeerAvailable:
        if (!stopped()) {
          scheduler_.peer_available();
          log_->info("{}: peer available, retrying now", to_string(settings_.kind));
        }
        break;
      case Command::Kind::Send:
        enqueue(std::move(c.msg), now);
        break;
      case Command::Kind::Retarget:
        if (!source_->retarget(c.target)) {
          log_->warn("{}: {} cannot be retargeted", to_string(settings_.kind), source_->name());
          break;
        }
        if (fsm_.has_connection()) {
          log_->info("{}: retarget, dropping current session", to_string(settings_.kind));
          raise(LinkEvent::SocketError);
          pump(now);
        }
        if (!stopped()) scheduler_.peer_available();
        break;
    }
  }
}

// pump(): run queued events through the FSM, one transition at a time.
void Transport::pump(uint64_t now) {
  while (!events_.empty()) {
    const LinkEvent ev = events_.front();
    events_.pop_front();
    const Transition t = fsm_.apply(ev);
    if (!t.accepted) {
      log_->debug("{}: event {} ignored in {}", to_string(settings_.kind), to_string(ev),
                  to_string(t.from));
      continue;
    }
    if (t.changed() || t.from == LinkState::Disconnected) on_transition(ev, t, now);
  }
}

void Transport::on_transition(LinkEvent ev, const Transition& t, uint64_t now) {
  log_->info("{}: {} -> {}{}{} ({})", to_string(settings_.kind), to_string(t.from), to_string(t.to),
             t.to == LinkState::Disconnected ? " reason=" : "",
             t.to == LinkState::Disconnected ? to_string(t.reason) : "",
             to_string(ev));

  switch (t.to) {
    case LinkState::Listening:
    case LinkState::Discovering:
      if (ev == LinkEvent::Start) {
        scheduler_.resume();
        scheduler_.peer_available();              // explicit start retries at once
      }
      break;

    case LinkState::Connecting: {
      Connection c;
      c.id        = g_next_conn_id++;
      c.peer      = pending_peer_;
      c.role      = role_;
      c.opened_ms = now;
      c.last_activity_ms = now;
      c.last_rx_ms       = now;
      conn_ = std::move(c);
      break;
    }

    case LinkState::AwaitingHandshake: {
      if (!conn_) break;
      if (stream_) conn_->peer = stream_->peer();
      conn_->peer.kind = settings_.kind;
      conn_->peer_name = conn_->peer.name.empty() ? conn_->peer.host : conn_->peer.name;
      fingerprint_ = SecurityGate::fingerprint(settings_.kind, conn_->peer.host);
      splitter_.clear();
      overflows_seen_ = 0;
      batch_.clear();
      tx_.clear();
      tx_off_ = 0;
      handshake_timer_.arm(conn_->id, now + settings_.handshake_timeout_ms);
      if (role_ == Role::Initiator) {
        HandshakeRequest req;
        req.major  = HandshakeCodec::MAX_MAJOR;
        req.legacy = settings_.legacy_handshake;
        req.auth   = HandshakeCodec::DEFAULT_AUTH;
        req.name   = settings_.local_name;
        append_tx(HandshakeCodec::build_request(req), now);
      }
      break;
    }

    case LinkState::Active:
      if (!conn_) break;
      handshake_timer_.disarm();
      scheduler_.reset();
      heartbeat_.reset(now);
      conn_->last_rx_ms = now;
      ++counters_.handshakes;
      log_->info("{}: conn={} active with '{}' (CB/{})", to_string(settings_.kind), conn_->id,
                 conn_->peer_name, conn_->protocol_major);
      break;

    case LinkState::Disconnected:
      teardown(now);
      if (t.reason == DisconnectReason::User) {
        scheduler_.suppress();
        source_->close();
      } else {
        const uint32_t d = scheduler_.on_failure(now);
        log_->info("{}: reconnect attempt {} in {} ms", to_string(settings_.kind),
                   scheduler_.failures(), d);
        raise(LinkEvent::Rearm);
      }
      break;

    case LinkState::Idle:
      break;
  }

  publish(t);
}

// teardown(): timers first, then the socket.
void Transport::teardown(uint64_t now) {
  (void)now;
  handshake_timer_.disarm();
  batch_timer_.disarm();
  batch_.clear();
  tx_.clear();
  tx_off_ = 0;
  splitter_.clear();
  if (stream_) {
    stream_->close();
    stream_.reset();
  }
}

void Transport::publish(const Transition& t) {
  TransportEvent e;
  e.kind   = settings_.kind;
  e.state  = t.to;
  e.reason = t.reason;
  if (conn_) {
    e.conn_id        = conn_->id;
    e.peer_name      = conn_->peer_name;
    e.protocol_major = conn_->protocol_major;
  }
  if (t.to == LinkState::Disconnected || t.to == LinkState::Listening ||
      t.to == LinkState::Discovering || t.to == LinkState::Idle) {
    conn_.reset();                                // the session is over once observers know
  }
  state_ = t.to;
  std::lock_guard<std::mutex> lock(events_mu_);
  published_.push_back(std::move(e));
}

// ---------- source ----------

void Transport::service_source(uint64_t now) {
  if (stopped()) return;

  const bool may_connect = waiting() && scheduler_.ready(now);
  auto ev = source_->poll(now, may_connect);

  if (source_->take_peer_appeared()) {
    scheduler_.peer_available();
    log_->info("{}: new peer discovered", to_string(settings_.kind));
  }

  using K = transport::SourceEvent::Kind;
  switch (ev.kind) {
    case K::None:
      break;

    case K::Dialing:
      if (waiting()) {
        pending_peer_ = ev.endpoint;
        raise(LinkEvent::SocketReady);
      }
      break;

    case K::Connected: {
      if (!waiting() && fsm_.state() != LinkState::Connecting) {
        ev.stream->close();                       // one session per transport
        break;
      }
      if (role_ == Role::Responder && settings_.enforce_ingress_limits) {
        const auto fp = SecurityGate::fingerprint(settings_.kind, ev.endpoint.host);
        if (!gate_.allow_connection(fp, now)) {
          ev.stream->close();                     // silent refusal
          break;
        }
      }
      pending_peer_ = ev.endpoint;
      stream_ = std::move(ev.stream);
      if (waiting()) raise(LinkEvent::SocketReady);
      raise(LinkEvent::Established);
      break;
    }

    case K::Failed:
      if (fsm_.state() == LinkState::Connecting) {
        raise(LinkEvent::SocketError);
      } else if (ev.error == TransportError::BindFailed) {
        scheduler_.schedule_fixed(now, settings_.bind_retry_ms);
        log_->warn("{}: {}, retry in {} ms", to_string(settings_.kind), to_string(ev.error),
                   settings_.bind_retry_ms);
      } else {
        const uint32_t d = scheduler_.on_failure(now);
        log_->warn("{}: {}, attempt {} retry in {} ms", to_string(settings_.kind),
                   to_string(ev.error), scheduler_.failures(), d);
      }
      break;
  }
}

// ---------- receive ----------

void Transport::read_input(uint64_t now) {
  uint8_t buf[READ_CHUNK];
  for (int i = 0; i < MAX_READS && stream_; ++i) {
    size_t n = 0;
    const auto r = stream_->recv(buf, sizeof(buf), n);
    if (r == transport::RxResult::None) break;
    if (r == transport::RxResult::Closed) {
      log_->info("{}: peer closed", to_string(settings_.kind));
      raise(LinkEvent::PeerClosed);
      return;
    }
    if (r == transport::RxResult::Error) {
      log_->warn("{}: {}", to_string(settings_.kind), to_string(TransportError::ReceiveFailed));
      raise(LinkEvent::SocketError);
      return;
    }

    if (conn_) {
      conn_->bytes_in += n;
      conn_->last_rx_ms = now;
      conn_->last_activity_ms = now;
    }
    heartbeat_.on_receive(now);                   // any byte counts as liveness

    splitter_.feed(buf, n);
    if (splitter_.overflows() != overflows_seen_) {
      overflows_seen_ = splitter_.overflows();
      ++counters_.protocol_errors;
      log_->warn("{}: {} line over {} bytes dropped", to_string(settings_.kind),
                 to_string(ProtocolError::MalformedFrame), settings_.max_line_bytes);
    }

    std::string line;
    while (stream_ && events_.empty() && splitter_.next_line(line)) {
      handle_line(line, now);
      pump(now);                                  // a handshake line changes how the next is read
    }
  }
}

void Transport::handle_line(const std::string& line, uint64_t now) {
  if (line.empty()) return;
  log_->debug("{}: <- {}", to_string(settings_.kind), line);
  switch (fsm_.state()) {
    case LinkState::AwaitingHandshake: handle_handshake_line(line); break;
    case LinkState::Active:            handle_data_line(line, now); break;
    default: break;
  }
}

void Transport::handle_handshake_line(const std::string& line) {
  if (!conn_) return;
  ProtocolError why = ProtocolError::None;

  if (role_ == Role::Responder) {
    auto req = HandshakeCodec::parse_request(line, why);
    if (!req) {
      ++counters_.protocol_errors;
      log_->warn("{}: {} dropped: '{}'", to_string(settings_.kind), to_string(why), line);
      raise(LinkEvent::LineRejected);
      return;
    }
    conn_->protocol_major = req->major;
    conn_->auth_token     = req->auth;
    if (!req->name.empty()) conn_->peer_name = HandshakeCodec::display_name(req->name);
    append_tx(HandshakeCodec::reply_for(*req), conn_->last_rx_ms);
    raise(LinkEvent::HandshakeAccepted);
    return;
  }

  auto reply = HandshakeCodec::parse_reply(line, why);
  if (!reply) {
    ++counters_.protocol_errors;
    log_->warn("{}: {} dropped: '{}'", to_string(settings_.kind), to_string(why), line);
    raise(LinkEvent::LineRejected);
    return;
  }
  conn_->protocol_major = reply->major;
  conn_->auth_token     = reply->hmac;
  raise(LinkEvent::HandshakeAccepted);
}

void Transport::handle_data_line(const std::string& line, uint64_t now) {
  ProtocolError why = ProtocolError::None;
  auto obj = MessageFramer::parse_object(line, why);
  if (!obj) {
    ++counters_.protocol_errors;
    ++counters_.dropped_in;
    log_->warn("{}: {} dropped", to_string(settings_.kind), to_string(why));
    return;
  }

  auto result = gate_.inspect(fingerprint_, *obj, now, settings_.enforce_ingress_limits);
  counters_.dropped_in += result.dropped;
  for (const auto& m : result.accepted) deliver(m);
}

void Transport::deliver(const Message& m) {
  switch (kind_of(m)) {
    case MessageKind::Heartbeat:
      break;                                      // liveness already refreshed by the bytes
    case MessageKind::Handshake:
      log_->debug("{}: informational handshake message", to_string(settings_.kind));
      break;
    default:
      ++counters_.messages_in;
      if (inbound_) inbound_(settings_.kind, m);
      break;
  }
}

// ---------- timers ----------

void Transport::check_timers(uint64_t now) {
  if (!conn_) return;

  if (handshake_timer_.fires(conn_->id, now)) {
    handshake_timer_.disarm();
    ++counters_.protocol_errors;
    log_->warn("{}: conn={} handshake timeout after {} ms", to_string(settings_.kind), conn_->id,
               settings_.handshake_timeout_ms);
    raise(LinkEvent::HandshakeTimeout);
    return;
  }

  if (fsm_.state() != LinkState::Active) return;

  if (heartbeat_.is_stale(now)) {
    log_->warn("{}: conn={} {} ({} ms silent)", to_string(settings_.kind), conn_->id,
               to_string(LivenessError::StaleConnection), heartbeat_.silence_ms(now));
    raise(LinkEvent::LivenessExpired);
    return;
  }

  if (heartbeat_.heartbeat_due(now)) {
    heartbeat_.on_heartbeat_sent(now);
    append_tx(MessageFramer::frame(Message{HeartbeatMessage{clock_.epoch_seconds()}}), now);
  }
}

// ---------- send ----------

void Transport::enqueue(Message m, uint64_t now) {
  if (fsm_.state() != LinkState::Active || !conn_) {
    ++counters_.dropped_out;                      // session ended after send() checked
    return;
  }
  if (batch_.full()) flush(now, true);

  if (!batch_.push(serialize(m), now)) {
    ++counters_.dropped_out;
    return;
  }
  ++counters_.messages_out;
  if (batch_.size() == 1) batch_timer_.arm(conn_->id, batch_.deadline_ms());

  if (batch_.full()) {
    flush(now, true);                             // hard cap: flush regardless of in-flight
  } else if (batch_.size() >= batch_.policy().batch_size) {
    flush(now, false);
  }
}

void Transport::flush_if_due(uint64_t now) {
  if (batch_.empty() || !conn_) return;
  if (batch_.size() >= batch_.policy().batch_size || batch_timer_.fires(conn_->id, now)) {
    flush(now, false);
  }
}

void Transport::flush(uint64_t now, bool force) {
  if (batch_.empty()) return;
  if (!force && tx_pending() > 0) {               // one flush in flight: defer, keep entries
    ++counters_.deferred_flushes;
    return;
  }
  const size_t n = batch_.size();
  const std::string frame = batch_.take_frame(clock_.epoch_seconds());
  batch_timer_.disarm();
  ++counters_.frames_out;
  log_->debug("{}: flush {} message(s), {} bytes{}", to_string(settings_.kind), n, frame.size(),
              force ? " (forced)" : "");
  append_tx(frame, now);
}

void Transport::append_tx(const std::string& bytes, uint64_t now) {
  if (!stream_) return;
  if (tx_off_ == tx_.size()) { tx_.clear(); tx_off_ = 0; }
  if (tx_pending() + bytes.size() > settings_.max_backlog_bytes) {
    log_->warn("{}: {} backlog over {} bytes", to_string(settings_.kind),
               to_string(TransportError::SendFailed), settings_.max_backlog_bytes);
    raise(LinkEvent::SocketError);
    return;
  }
  tx_ += bytes;
  write_pending(now);
}

void Transport::write_pending(uint64_t now) {
  while (stream_ && tx_off_ < tx_.size()) {
    size_t written = 0;
    const auto r = stream_->send(reinterpret_cast<const uint8_t*>(tx_.data()) + tx_off_,
                                 tx_.size() - tx_off_, written);
    if (r == transport::TxResult::Busy) break;
    if (r == transport::TxResult::Error) {
      log_->warn("{}: {}", to_string(settings_.kind), to_string(TransportError::SendFailed));
      raise(LinkEvent::SocketError);
      return;
    }
    if (written == 0) break;
    tx_off_ += written;
    if (conn_) {
      conn_->bytes_out += written;
      conn_->last_activity_ms = now;
    }
  }
  if (tx_off_ == tx_.size()) { tx_.clear(); tx_off_ = 0; }
}

} // namespace cuelink
