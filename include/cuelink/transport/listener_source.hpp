#pragma once
/**
 * @file listener_source.hpp
 * @brief Accepting socket source (handshake responder).
 *
 * Device side: the tunnel listener on 127.0.0.1:9360 that the host's USB
 * multiplexing forwarder connects into. Host side: the LAN listener, paired
 * with a ServiceAdvertiser so devices can find it.
 *
 * The listening socket is opened on the first poll that may connect and is
 * kept across sessions; only `close()` releases it.
 */

#include <cstdint>
#include <memory>
#include <string>

#include "cuelink/logging.hpp"
#include "cuelink/transport/discovery.hpp"
#include "cuelink/transport/transport_base.hpp"

namespace cuelink::transport {

struct ListenerConfig {
  std::string bind_host{"127.0.0.1"};
  uint16_t    port{9360};
  int         backlog{4};
};

class TcpListenerSource : public ISocketSource {
public:
  TcpListenerSource(TransportKind kind, ListenerConfig cfg,
                    std::unique_ptr<ServiceAdvertiser> advertiser = nullptr,
                    Logger log = nullptr);
  ~TcpListenerSource() override;

  Role          role() const override { return Role::Responder; }
  TransportKind kind() const override { return kind_; }
  LinkState     waiting_state() const override { return LinkState::Listening; }
  const char*   name() const override { return "tcp-listener"; }

  SourceEvent poll(uint64_t now_ms, bool may_connect) override;
  void        close() override;

  /// Actual bound port (useful when configured with port 0). 0 if not bound.
  uint16_t bound_port() const;
  bool     is_listening() const { return fd_ >= 0; }

private:
  bool open_listener();

  TransportKind                      kind_;
  ListenerConfig                     cfg_;
  std::unique_ptr<ServiceAdvertiser> advertiser_;
  Logger                             log_;
  int                                fd_{-1};
};

} // namespace cuelink::transport
