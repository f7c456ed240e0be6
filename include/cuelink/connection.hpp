#pragma once
/**
 * @file connection.hpp
 * @brief Endpoint, Connection, per-connection timers and the link FSM.
 *
 * @details
 * ## State machine
 * ```
 *  Idle ──Start──► Listening | Discovering ──SocketReady──► Connecting
 *                        ▲                                      │ Established
 *                        │ Rearm                                ▼
 *                  Disconnected{stale|error|user} ◄──── AwaitingHandshake
 *                        ▲                                      │ HandshakeAccepted
 *                        └──── SocketError/PeerClosed/Stale ─── Active
 * ```
 * - `LineRejected` in AwaitingHandshake is accepted but does not move state.
 * - `HandshakeTimeout` in AwaitingHandshake → Disconnected{error}.
 * - `Stop` from any live state → Disconnected{user}. Only `Start` leaves it.
 * - Events that do not apply to the current state are rejected and change
 *   nothing.
 *
 * `ConnectionFsm::apply()` is the only place state changes. The owning
 * Transport feeds it from an event queue and reacts to the returned
 * `Transition`.
 */

#include <cstdint>
#include <string>

namespace cuelink {

enum class TransportKind : uint8_t { Tunnel = 0, Lan = 1 };

/// Initiator dials and sends `CB/...`; Responder accepts and answers `OK/...`.
enum class Role : uint8_t { Initiator, Responder };

enum class LinkState : uint8_t {
  Idle,
  Listening,
  Discovering,
  Connecting,
  AwaitingHandshake,
  Active,
  Disconnected,
};

enum class DisconnectReason : uint8_t { None, Stale, Error, User };

enum class LinkEvent : uint8_t {
  Start,
  SocketReady,
  Established,
  HandshakeAccepted,
  LineRejected,
  HandshakeTimeout,
  SocketError,
  PeerClosed,
  LivenessExpired,
  Stop,
  Rearm,
};

const char* to_string(TransportKind k);
const char* to_string(Role r);
const char* to_string(LinkState s);
const char* to_string(DisconnectReason r);
const char* to_string(LinkEvent e);

struct Endpoint {
  TransportKind kind{TransportKind::Tunnel};
  std::string   host;       // numeric address or resolvable name
  uint16_t      port{0};
  std::string   name;       // human-readable label (service name, peer name)

  std::string address() const { return host + ":" + std::to_string(port); }
};

/**
 * @brief One live socket session. Owned by its Transport; observers only see
 * the events the Transport publishes.
 */
struct Connection {
  uint64_t    id{0};                 // monotonic per process
  Endpoint    peer;
  Role        role{Role::Responder};
  uint64_t    opened_ms{0};
  uint64_t    last_activity_ms{0};   // any send or receive
  uint64_t    last_rx_ms{0};         // receives only (liveness)
  int         protocol_major{0};     // 0 until handshake completes
  std::string peer_name;             // display form
  std::string auth_token;            // opaque, never verified
  uint64_t    bytes_in{0};
  uint64_t    bytes_out{0};
};

/**
 * @brief Deadline bound to one connection id.
 *
 * A timer armed for connection 7 never fires once connection 8 exists,
 * even if nobody disarmed it.
 */
struct ConnTimer {
  uint64_t conn_id{0};
  uint64_t deadline_ms{0};
  bool     armed{false};

  void arm(uint64_t id, uint64_t deadline) { conn_id = id; deadline_ms = deadline; armed = true; }
  void disarm() { armed = false; }
  bool fires(uint64_t current_id, uint64_t now_ms) const {
    return armed && conn_id == current_id && now_ms >= deadline_ms;
  }
};

struct Transition {
  LinkState        from{LinkState::Idle};
  LinkState        to{LinkState::Idle};
  DisconnectReason reason{DisconnectReason::None};
  bool             accepted{false};  // event applied to this state
  bool             changed() const { return accepted && from != to; }
};

class ConnectionFsm {
public:
  /// @param waiting_state Listening (listener adapters) or Discovering (dialers).
  explicit ConnectionFsm(LinkState waiting_state = LinkState::Listening)
  : waiting_(waiting_state) {}

  Transition apply(LinkEvent ev);

  LinkState        state() const  { return state_; }
  DisconnectReason reason() const { return reason_; }
  LinkState        waiting_state() const { return waiting_; }

  /// Connecting, AwaitingHandshake or Active: a socket is in play.
  bool has_connection() const {
    return state_ == LinkState::Connecting || state_ == LinkState::AwaitingHandshake ||
           state_ == LinkState::Active;
  }

private:
  LinkState        waiting_;
  LinkState        state_{LinkState::Idle};
  DisconnectReason reason_{DisconnectReason::None};
};

} // namespace cuelink
