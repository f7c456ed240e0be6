#pragma once
/**
 * @file dialer_source.hpp
 * @brief Connecting socket source (handshake initiator).
 *
 * Device side: the LAN client that dials whatever the ServiceBrowser found.
 * Host side: the tunnel client that dials the forwarder's local port.
 *
 * Connects are non-blocking: `poll()` starts one (Dialing), later polls
 * finish it (Connected / Failed). An in-flight connect that exceeds
 * `connect_timeout_ms` is abandoned as connect-failed.
 *
 * Targets must carry a numeric host. Names are never looked up here, so
 * `poll()` does not block on DNS; resolve configured names once at startup
 * with `net::resolve_host()`. A beacon's host is already numeric.
 */

#include <cstdint>
#include <memory>
#include <optional>

#include "cuelink/logging.hpp"
#include "cuelink/transport/discovery.hpp"
#include "cuelink/transport/transport_base.hpp"

namespace cuelink::transport {

struct DialerConfig {
  uint32_t connect_timeout_ms{5000};
};

class TcpDialerSource : public ISocketSource {
public:
  TcpDialerSource(TransportKind kind, std::shared_ptr<EndpointProvider> provider,
                  DialerConfig cfg = {}, Logger log = nullptr);
  ~TcpDialerSource() override;

  Role          role() const override { return Role::Initiator; }
  TransportKind kind() const override { return kind_; }
  LinkState     waiting_state() const override { return LinkState::Discovering; }
  const char*   name() const override { return "tcp-dialer"; }

  SourceEvent poll(uint64_t now_ms, bool may_connect) override;
  void        close() override;
  bool        take_peer_appeared() override;
  bool        retarget(const std::optional<Endpoint>& ep) override;

  bool dialing() const { return fd_ >= 0; }

private:
  SourceEvent start_connect(const Endpoint& target, uint64_t now_ms);
  SourceEvent finish_connect(uint64_t now_ms);
  void        abort_connect();

  TransportKind                     kind_;
  std::shared_ptr<EndpointProvider> provider_;
  DialerConfig                      cfg_;
  Logger                            log_;
  std::optional<Endpoint>           override_;
  bool                              appeared_{false};

  // in-flight connect
  int      fd_{-1};
  Endpoint target_;
  uint64_t deadline_ms_{0};
};

} // namespace cuelink::transport
