#pragma once
/**
 * @file transport_base.hpp
 * @brief Socket-level seams the generic Transport is written against.
 *
 * @details
 * Two interfaces, both non-blocking and poll-driven:
 *
 * - `IStream`: one connected byte stream (a TCP socket in production, an
 *   in-memory pipe in tests).
 * - `ISocketSource`: where streams come from. A listener accepts them
 *   (responder role), a dialer connects out to a discovered or configured
 *   endpoint (initiator role).
 *
 * Contract:
 *  - Nothing here blocks. `poll()` does a bounded amount of work and returns.
 *  - `recv()` returns None when no bytes are ready, Closed on orderly EOF.
 *  - `send()` may write part of the buffer; `written` says how much. Busy
 *    means nothing could be written right now.
 *  - All calls come from the owning Transport's I/O context.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include "cuelink/connection.hpp"
#include "cuelink/errors.hpp"

namespace cuelink::transport {

// Return codes kept small; errors carry detail through TransportError.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2, Closed=3 };

class IStream {
public:
  virtual ~IStream() = default;
  virtual RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) = 0;
  virtual void close() = 0;
  virtual const Endpoint& peer() const = 0;
};

/// What a source produced during one poll.
struct SourceEvent {
  enum class Kind : uint8_t { None, Dialing, Connected, Failed };

  Kind                     kind{Kind::None};
  std::unique_ptr<IStream> stream;                      // Connected only
  TransportError           error{TransportError::None}; // Failed only
  Endpoint                 endpoint;                    // who we dialed / accepted

  static SourceEvent none() { return {}; }
  static SourceEvent dialing(Endpoint ep) {
    SourceEvent e; e.kind = Kind::Dialing; e.endpoint = std::move(ep); return e;
  }
  static SourceEvent connected(std::unique_ptr<IStream> s) {
    SourceEvent e; e.kind = Kind::Connected; e.endpoint = s->peer(); e.stream = std::move(s); return e;
  }
  static SourceEvent failed(TransportError err, Endpoint ep = {}) {
    SourceEvent e; e.kind = Kind::Failed; e.error = err; e.endpoint = std::move(ep); return e;
  }
};

class ISocketSource {
public:
  virtual ~ISocketSource() = default;

  virtual Role          role() const = 0;
  virtual TransportKind kind() const = 0;
  /// Listening (accepting sources) or Discovering (dialing sources).
  virtual LinkState     waiting_state() const = 0;
  virtual const char*   name() const = 0;

  /**
   * @brief Non-blocking service work.
   * @param may_connect the owner has no session and its backoff allows a new
   *        one. A dial already in flight is always carried to completion.
   */
  virtual SourceEvent poll(uint64_t now_ms, bool may_connect) = 0;

  /// Release every socket the source holds. `poll()` reopens on demand.
  virtual void close() = 0;

  /// Consumed once per newly discovered peer.
  virtual bool take_peer_appeared() { return false; }

  /// Point a dialer at an explicit endpoint (nullopt: back to discovery).
  virtual bool retarget(const std::optional<Endpoint>& ep) { (void)ep; return false; }
};

} // namespace cuelink::transport
