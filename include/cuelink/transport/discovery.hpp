#pragma once
/**
 * @file discovery.hpp
 * @brief LAN service discovery over UDP multicast beacons.
 *
 * @details
 * ## Why multicast beacons
 * The LAN transport needs two things from discovery: "which host:port should
 * I dial" and "a new peer just showed up, stop waiting out the backoff". A
 * periodic JSON beacon on a well-known group answers both without a system
 * daemon. Entries expire when their TTL lapses without a fresh beacon.
 *
 * ## Beacon
 * ```
 * {"service":"_cuebear._tcp","name":"Studio Mac","port":9361,"ttl":5}
 * ```
 * Sent to `group:port` every `beacon_interval_ms`. The sender address of the
 * datagram supplies the host; the beacon never carries an address itself.
 *
 * ## Providers
 * The dialer asks an `EndpointProvider` for the endpoint to dial:
 * - `StaticEndpoint`: a configured host:port (discovery off).
 * - `ServiceBrowser`: the most recently heard live service.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "etl/map.h"

#include "cuelink/connection.hpp"
#include "cuelink/logging.hpp"

namespace cuelink::transport {

struct DiscoveryConfig {
  std::string group{"239.255.42.99"};
  uint16_t    port{9362};
  std::string service{"_cuebear._tcp"};
  uint32_t    beacon_interval_ms{1000};
  uint32_t    ttl_s{5};
};

struct Beacon {
  std::string service;
  std::string name;
  uint16_t    port{0};
  uint32_t    ttl_s{0};
};

std::string           encode_beacon(const Beacon& b);
std::optional<Beacon> decode_beacon(const std::string& payload);

class EndpointProvider {
public:
  virtual ~EndpointProvider() = default;
  virtual void poll(uint64_t now_ms) { (void)now_ms; }
  virtual std::optional<Endpoint> current(uint64_t now_ms) const = 0;
  /// True once after a previously unknown peer appears.
  virtual bool take_new_peer() { return false; }
};

class StaticEndpoint : public EndpointProvider {
public:
  explicit StaticEndpoint(Endpoint ep) : ep_(std::move(ep)) {}
  std::optional<Endpoint> current(uint64_t) const override { return ep_; }
private:
  Endpoint ep_;
};

/**
 * @brief Listens for beacons and keeps a TTL-bounded table of services.
 */
class ServiceBrowser : public EndpointProvider {
public:
  /// Table capacity. A new name at capacity evicts the least recently heard.
  static constexpr size_t MAX_SERVICES = 32;

  ServiceBrowser(DiscoveryConfig cfg, TransportKind kind, Logger log = nullptr);
  ~ServiceBrowser() override;

  ServiceBrowser(const ServiceBrowser&) = delete;
  ServiceBrowser& operator=(const ServiceBrowser&) = delete;

  /// Drain pending datagrams and expire stale entries. Opens the socket lazily.
  void poll(uint64_t now_ms) override;
  std::optional<Endpoint> current(uint64_t now_ms) const override;
  bool take_new_peer() override;

  /// Feed one beacon as if received from `host` (also used by poll()).
  void observe(const std::string& payload, const std::string& host, uint64_t now_ms);

  size_t size() const { return services_.size(); }
  void   close();

private:
  struct Entry {
    Endpoint endpoint;
    uint64_t last_seen_ms{0};
    uint64_t expires_ms{0};
  };

  bool open_socket();
  void expire(uint64_t now_ms);
  void evict_oldest();

  DiscoveryConfig              cfg_;
  TransportKind                kind_;
  Logger                       log_;
  int                          fd_{-1};
  uint64_t                     next_open_ms_{0};
  etl::map<std::string, Entry, MAX_SERVICES> services_;   // keyed by service name
  bool                         new_peer_{false};
};

/**
 * @brief Periodically multicasts this node's beacon.
 */
class ServiceAdvertiser {
public:
  ServiceAdvertiser(DiscoveryConfig cfg, std::string name, uint16_t tcp_port, Logger log = nullptr);
  ~ServiceAdvertiser();

  ServiceAdvertiser(const ServiceAdvertiser&) = delete;
  ServiceAdvertiser& operator=(const ServiceAdvertiser&) = delete;

  /// Send a beacon if the interval elapsed. Opens the socket lazily.
  void poll(uint64_t now_ms);
  void close();

  Beacon   beacon() const;
  uint64_t sent() const { return sent_; }

private:
  bool open_socket();

  DiscoveryConfig cfg_;
  std::string     name_;
  uint16_t        tcp_port_;
  Logger          log_;
  int             fd_{-1};
  uint64_t        next_beacon_ms_{0};
  uint64_t        sent_{0};
};

} // namespace cuelink::transport
