#pragma once
/**
 * @file transport.hpp
 * @brief Generic Transport: one socket source, one Connection at a time.
 *
 * @details
 * ## Field Brief
 * Tunnel and LAN differ only in where their sockets come from. Everything
 * after that (handshake, framing, batching, liveness, backoff) is the same
 * code, so it lives here once and the two transports are this class wired
 * to different `ISocketSource` adapters:
 *
 * | transport | device side                     | host side                          |
 * |-----------|---------------------------------|------------------------------------|
 * | Tunnel    | TcpListenerSource 127.0.0.1:9360 | TcpDialerSource → forwarder port   |
 * | LAN       | TcpDialerSource + ServiceBrowser | TcpListenerSource + Advertiser     |
 *
 * ## Operational model
 * ```
 *  app thread                         transport I/O context (poll())
 *  ----------                         ------------------------------
 *  start/stop/send/peer_available ──► mailbox (mutex) ──► drain
 *                                                          │
 *                                      source.poll() ──────┤ SocketReady / Established
 *                                      stream.recv() ──────┤ lines → handshake | data
 *                                      timers ─────────────┤ handshake / batch / heartbeat / stale
 *                                                          ▼
 *                                      events_ ──► ConnectionFsm::apply() ──► on_transition()
 *                                                          │
 *  Coordinator::tick() ◄── poll_event() ◄── published (mutex)
 *  MidiSink           ◄── inbound handler (called on the I/O context)
 * ```
 *
 * - Every state change goes through `ConnectionFsm::apply()`; side effects
 *   happen in `on_transition()`.
 * - Timers carry the connection id they were armed for and are ignored once
 *   that connection is gone.
 * - Serialization and batching happen on the I/O context, never on the
 *   caller of `send()`.
 *
 * ## Failure model
 * - Socket errors, peer close, handshake timeout → Disconnected{error}.
 * - Silence past the stale threshold → Disconnected{stale}.
 * - Both re-arm the source and engage the ReconnectionScheduler.
 * - `stop()` → Disconnected{user}; the scheduler is suppressed until `start()`.
 * - Nothing escapes `poll()`.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "cuelink/clock.hpp"
#include "cuelink/connection.hpp"
#include "cuelink/framer.hpp"
#include "cuelink/heartbeat.hpp"
#include "cuelink/logging.hpp"
#include "cuelink/message.hpp"
#include "cuelink/reconnect.hpp"
#include "cuelink/security_gate.hpp"
#include "cuelink/transport/transport_base.hpp"

namespace cuelink {

struct TransportSettings {
  TransportKind kind{TransportKind::Tunnel};
  std::string   local_name{"cuelink"};     ///< sent as name= when initiating
  uint32_t      handshake_timeout_ms{3000};
  uint32_t      heartbeat_interval_ms{1000};
  uint32_t      stale_after_ms{3000};
  uint32_t      bind_retry_ms{5000};       ///< fixed delay after bind-failed
  BatchPolicy   batch;
  bool          legacy_handshake{false};   ///< initiate with "CB/1 HELLO"
  size_t        max_line_bytes{LineSplitter::DEFAULT_MAX_LINE};
  size_t        max_backlog_bytes{1u << 20};
  bool          enforce_ingress_limits{true};  ///< rate-limit peers (host side only)
};

/// Published on every state change, drained by the Coordinator.
struct TransportEvent {
  TransportKind    kind{TransportKind::Tunnel};
  uint64_t         conn_id{0};
  LinkState        state{LinkState::Idle};
  DisconnectReason reason{DisconnectReason::None};
  std::string      peer_name;
  int              protocol_major{0};
};

struct TransportCounters {
  uint64_t frames_out{0};
  uint64_t messages_out{0};
  uint64_t messages_in{0};
  uint64_t dropped_out{0};      // send() while not Active
  uint64_t dropped_in{0};       // security / malformed
  uint64_t deferred_flushes{0}; // flush held back by an in-flight one
  uint64_t protocol_errors{0};
  uint64_t handshakes{0};
};

using InboundHandler = std::function<void(TransportKind, const Message&)>;

class Transport {
public:
  static constexpr size_t MAILBOX_CAP = 4096;   ///< queued commands before send() refuses
  static constexpr size_t READ_CHUNK  = 4096;
  static constexpr int    MAX_READS   = 16;     ///< recv() calls per poll

  Transport(TransportSettings settings,
            std::unique_ptr<transport::ISocketSource> source,
            const Clock& clock,
            SecurityGate& gate,
            Logger log = nullptr);
  ~Transport();

  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;

  // ---------- any thread ----------

  void start();
  void stop();
  /**
   * @brief Queue a message for the current session.
   * @return false (message dropped) when the transport is not Active or the
   *         mailbox is full. Nothing is kept for a later session.
   */
  bool send(Message m);
  /// Cable attached / service appeared: skip any pending backoff.
  void peer_available();
  /// Dial an explicit endpoint (dialer sources only); nullopt returns to discovery.
  void retarget(std::optional<Endpoint> ep);

  /// Set before the I/O context starts polling.
  void set_inbound_handler(InboundHandler h) { inbound_ = std::move(h); }

  TransportKind kind() const    { return settings_.kind; }
  Role          role() const    { return role_; }
  LinkState     state() const   { return state_.load(); }
  bool          is_active() const { return state_.load() == LinkState::Active; }
  LinkQuality   quality() const { return quality_.load(); }

  /// Pop the oldest published state change. False when none.
  bool poll_event(TransportEvent& out);

  // ---------- owning I/O context ----------

  /// One bounded round of work. Never blocks, never throws.
  void poll();

  // Inspection (I/O context or tests that drive poll() themselves).
  const ConnectionFsm&             fsm() const        { return fsm_; }
  const std::optional<Connection>& connection() const { return conn_; }
  const ReconnectionScheduler&     scheduler() const  { return scheduler_; }
  const TransportCounters&         counters() const   { return counters_; }
  const TransportSettings&         settings() const   { return settings_; }
  size_t queued_in_batch() const { return batch_.size(); }
  size_t tx_pending() const      { return tx_.size() - tx_off_; }

private:
  struct Command {
    enum class Kind : uint8_t { Start, Stop, PeerAvailable, Send, Retarget };
    Kind                    kind{Kind::Start};
    Message                 msg;
    std::optional<Endpoint> target;
  };

  bool push_command(Command c);
  void drain_mailbox(uint64_t now);

  // FSM plumbing
  void raise(LinkEvent ev) { events_.push_back(ev); }
  void pump(uint64_t now);
  void on_transition(LinkEvent ev, const Transition& t, uint64_t now);
  void teardown(uint64_t now);
  void publish(const Transition& t);

  // I/O
  void service_source(uint64_t now);
  void read_input(uint64_t now);
  void handle_line(const std::string& line, uint64_t now);
  void handle_handshake_line(const std::string& line);
  void handle_data_line(const std::string& line, uint64_t now);
  void deliver(const Message& m);
  void check_timers(uint64_t now);

  // send path
  void enqueue(Message m, uint64_t now);
  void flush(uint64_t now, bool force);
  void flush_if_due(uint64_t now);
  void append_tx(const std::string& bytes, uint64_t now);
  void write_pending(uint64_t now);

  bool waiting() const {
    return fsm_.state() == LinkState::Listening || fsm_.state() == LinkState::Discovering;
  }
  bool stopped() const {
    return fsm_.state() == LinkState::Idle ||
           (fsm_.state() == LinkState::Disconnected && fsm_.reason() == DisconnectReason::User);
  }

  TransportSettings                         settings_;
  std::unique_ptr<transport::ISocketSource> source_;
  const Clock&                              clock_;
  SecurityGate&                             gate_;
  Logger                                    log_;
  Role                                      role_;

  // ---- I/O context only ----
  ConnectionFsm                       fsm_;
  std::deque<LinkEvent>               events_;
  std::optional<Connection>           conn_;
  std::unique_ptr<transport::IStream> stream_;
  Endpoint                            pending_peer_;
  std::string                         fingerprint_;
  LineSplitter                        splitter_;
  size_t                              overflows_seen_{0};
  OutgoingBatch                       batch_;
  std::string                         tx_;
  size_t                              tx_off_{0};
  ConnTimer                           handshake_timer_;
  ConnTimer                           batch_timer_;
  HeartbeatMonitor                    heartbeat_;
  ReconnectionScheduler               scheduler_;
  TransportCounters                   counters_;
  InboundHandler                      inbound_;

  // ---- shared ----
  std::mutex                 mailbox_mu_;
  std::deque<Command>        mailbox_;
  std::mutex                 events_mu_;
  std::deque<TransportEvent> published_;
  std::atomic<LinkState>     state_{LinkState::Idle};
  std::atomic<LinkQuality>   quality_{LinkQuality::Disconnected};
};

} // namespace cuelink
