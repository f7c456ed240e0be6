// -----------------------------------------------------------------------------
// connection.cpp — ConnectionFsm transition function + enum names
//
// State diagram and event list:
//   see include/cuelink/connection.hpp
// -----------------------------------------------------------------------------
#include "cuelink/connection.hpp"

namespace cuelink {

const char* to_string(TransportKind k) {
  return k == TransportKind::Tunnel ? "tunnel" : "lan";
}

const char* to_string(Role r) {
  return r == Role::Initiator ? "initiator" : "responder";
}

const char* to_string(LinkState s) {
  switch (s) {
    case LinkState::Idle:              return "idle";
    case LinkState::Listening:         return "listening";
    case LinkState::Discovering:       return "discovering";
    case LinkState::Connecting:        return "connecting";
    case LinkState::AwaitingHandshake: return "awaiting-handshake";
    case LinkState::Active:            return "active";
    case LinkState::Disconnected:      return "disconnected";
  }
  return "unknown";
}

const char* to_string(DisconnectReason r) {
  switch (r) {
    case DisconnectReason::None:  return "none";
    case DisconnectReason::Stale: return "stale";
    case DisconnectReason::Error: return "error";
    case DisconnectReason::User:  return "user";
  }
  return "unknown";
}

const char* to_string(LinkEvent e) {
  switch (e) {
    case LinkEvent::Start:             return "start";
    case LinkEvent::SocketReady:       return "socket-ready";
    case LinkEvent::Established:       return "established";
    case LinkEvent::HandshakeAccepted: return "handshake-accepted";
    case LinkEvent::LineRejected:      return "line-rejected";
    case LinkEvent::HandshakeTimeout:  return "handshake-timeout";
    case LinkEvent::SocketError:       return "socket-error";
    case LinkEvent::PeerClosed:        return "peer-closed";
    case LinkEvent::LivenessExpired:   return "liveness-expired";
    case LinkEvent::Stop:              return "stop";
    case LinkEvent::Rearm:             return "rearm";
  }
  return "unknown";
}

// apply(): the single transition function. Every state change goes through here.
Transition ConnectionFsm::apply(LinkEvent ev) {
  Transition t;
  t.from = state_;

  auto go = [&](LinkState to, DisconnectReason why = DisconnectReason::None) {
    state_  = to;
    reason_ = why;
    t.accepted = true;
  };

  // Stop is valid from every live state and wins over everything else.
  if (ev == LinkEvent::Stop) {
    if (state_ == LinkState::Idle) {
      // nothing running; stays Idle
    } else if (state_ == LinkState::Disconnected && reason_ == DisconnectReason::User) {
      // already stopped
    } else {
      go(LinkState::Disconnected, DisconnectReason::User);
    }
    t.to = state_; t.reason = reason_;
    return t;
  }

  switch (state_) {
    case LinkState::Idle:
      if (ev == LinkEvent::Start) go(waiting_);
      break;

    case LinkState::Listening:
    case LinkState::Discovering:
      if (ev == LinkEvent::SocketReady) go(LinkState::Connecting);
      break;

    case LinkState::Connecting:
      if (ev == LinkEvent::Established) go(LinkState::AwaitingHandshake);
      else if (ev == LinkEvent::SocketError || ev == LinkEvent::PeerClosed)
        go(LinkState::Disconnected, DisconnectReason::Error);
      break;

    case LinkState::AwaitingHandshake:
      if (ev == LinkEvent::HandshakeAccepted) go(LinkState::Active);
      else if (ev == LinkEvent::LineRejected) go(LinkState::AwaitingHandshake);  // dropped line
      else if (ev == LinkEvent::HandshakeTimeout || ev == LinkEvent::SocketError ||
               ev == LinkEvent::PeerClosed)
        go(LinkState::Disconnected, DisconnectReason::Error);
      break;

    case LinkState::Active:
      if (ev == LinkEvent::SocketError || ev == LinkEvent::PeerClosed)
        go(LinkState::Disconnected, DisconnectReason::Error);
      else if (ev == LinkEvent::LivenessExpired)
        go(LinkState::Disconnected, DisconnectReason::Stale);
      break;

    case LinkState::Disconnected:
      if (ev == LinkEvent::Start) go(waiting_);
      else if (ev == LinkEvent::Rearm && reason_ != DisconnectReason::User) go(waiting_);
      break;
  }

  t.to = state_;
  t.reason = reason_;
  return t;
}

} // namespace cuelink
