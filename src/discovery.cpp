// -----------------------------------------------------------------------------
// discovery.cpp — beacon codec, ServiceBrowser, ServiceAdvertiser
//
// API & beacon format:
//   see include/cuelink/transport/discovery.hpp
//
// NOTE: socket setup failures are logged and retried on a later poll; the
// browser simply reports no endpoint until its socket comes up.
// -----------------------------------------------------------------------------
#include "cuelink/transport/discovery.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "nlohmann/json.hpp"

#include "cuelink/transport/tcp_stream.hpp"

namespace cuelink::transport {

using json = nlohmann::json;

namespace {
constexpr uint32_t REOPEN_DELAY_MS = 5000;   // retry interval after socket setup fails
constexpr size_t   MAX_DATAGRAM    = 1024;
constexpr int      MAX_DRAIN       = 32;     // datagrams per poll
} // namespace

// ---------- beacon codec ----------

std::string encode_beacon(const Beacon& b) {
  json j;
  j["service"] = b.service;
  j["name"]    = b.name;
  j["port"]    = b.port;
  j["ttl"]     = b.ttl_s;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<Beacon> decode_beacon(const std::string& payload) {
  json j = json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  auto s = j.find("service");
  auto n = j.find("name");
  auto p = j.find("port");
  if (s == j.end() || !s->is_string()) return std::nullopt;
  if (n == j.end() || !n->is_string()) return std::nullopt;
  if (p == j.end() || !p->is_number_unsigned()) return std::nullopt;
  const auto port = p->get<uint64_t>();
  if (port == 0 || port > 65535) return std::nullopt;

  Beacon b;
  b.service = s->get<std::string>();
  b.name    = n->get<std::string>();
  b.port    = static_cast<uint16_t>(port);
  b.ttl_s   = 5;
  auto t = j.find("ttl");
  if (t != j.end() && t->is_number_unsigned()) {
    const auto ttl = t->get<uint64_t>();
    if (ttl > 0 && ttl <= 3600) b.ttl_s = static_cast<uint32_t>(ttl);
  }
  return b;
}

// ---------- ServiceBrowser ----------

ServiceBrowser::ServiceBrowser(DiscoveryConfig cfg, TransportKind kind, Logger log)
: cfg_(std::move(cfg)), kind_(kind), log_(or_null(std::move(log))) {}

ServiceBrowser::~ServiceBrowser() { close(); }

void ServiceBrowser::close() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool ServiceBrowser::open_socket() {
  fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd_ < 0) {
    log_->warn("discovery: browser socket failed: {}", net::last_error());
    return false;
  }

  int reuse = 1;
  ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
  ::setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));  // several browsers per host
#endif

  sockaddr_in local{};
  local.sin_family      = AF_INET;
  local.sin_port        = htons(cfg_.port);
  local.sin_addr.s_addr = htonl(INADDR_ANY);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
    log_->warn("discovery: browser bind :{} failed: {}", cfg_.port, net::last_error());
    close();
    return false;
  }

  ip_mreq mreq{};
  if (::inet_pton(AF_INET, cfg_.group.c_str(), &mreq.imr_multiaddr) != 1) {
    log_->error("discovery: invalid multicast group '{}'", cfg_.group);
    close();
    return false;
  }
  mreq.imr_interface.s_addr = htonl(INADDR_ANY);
  if (::setsockopt(fd_, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
    log_->warn("discovery: join {} failed: {}", cfg_.group, net::last_error());
    close();
    return false;
  }

  if (!net::set_non_blocking(fd_)) {
    log_->warn("discovery: browser non-blocking failed: {}", net::last_error());
    close();
    return false;
  }
  log_->info("discovery: browsing {} on {}:{}", cfg_.service, cfg_.group, cfg_.port);
  return true;
}

void ServiceBrowser::poll(uint64_t now_ms) {
  if (fd_ < 0 && now_ms >= next_open_ms_) {
    if (!open_socket()) next_open_ms_ = now_ms + REOPEN_DELAY_MS;
  }

  if (fd_ >= 0) {
    char buf[MAX_DATAGRAM];
    for (int i = 0; i < MAX_DRAIN; ++i) {
      sockaddr_in from{};
      socklen_t   from_len = sizeof(from);
      const ssize_t n = ::recvfrom(fd_, buf, sizeof(buf), 0,
                                   reinterpret_cast<sockaddr*>(&from), &from_len);
      if (n <= 0) break;                           // EAGAIN or nothing useful
      char ip[INET_ADDRSTRLEN] = {0};
      ::inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));
      observe(std::string(buf, static_cast<size_t>(n)), ip, now_ms);
    }
  }

  expire(now_ms);
}

void ServiceBrowser::observe(const std::string& payload, const std::string& host, uint64_t now_ms) {
  auto b = decode_beacon(payload);
  if (!b) {
    log_->debug("discovery: ignored malformed beacon from {}", host);
    return;
  }
  if (b->service != cfg_.service) return;          // someone else's service

  auto it = services_.find(b->name);
  const bool is_new = (it == services_.end());
  if (is_new && services_.full()) {
    expire(now_ms);
    if (services_.full()) evict_oldest();
  }
  Entry& e = services_[b->name];
  e.endpoint.kind = kind_;
  e.endpoint.host = host;
  e.endpoint.port = b->port;
  e.endpoint.name = b->name;
  e.last_seen_ms  = now_ms;
  e.expires_ms    = now_ms + 1000ull * b->ttl_s;

  if (is_new) {
    new_peer_ = true;
    log_->info("discovery: found '{}' at {}", b->name, e.endpoint.address());
  }
}

void ServiceBrowser::expire(uint64_t now_ms) {
  for (auto it = services_.begin(); it != services_.end();) {
    if (now_ms >= it->second.expires_ms) {
      log_->info("discovery: lost '{}'", it->first);
      it = services_.erase(it);
    } else {
      ++it;
    }
  }
}

void ServiceBrowser::evict_oldest() {
  auto oldest = services_.begin();
  for (auto it = services_.begin(); it != services_.end(); ++it) {
    if (it->second.last_seen_ms < oldest->second.last_seen_ms) oldest = it;
  }
  log_->warn("discovery: table full, dropping '{}'", oldest->first);
  services_.erase(oldest);
}

std::optional<Endpoint> ServiceBrowser::current(uint64_t now_ms) const {
  const Entry* best = nullptr;
  for (const auto& kv : services_) {
    if (now_ms >= kv.second.expires_ms) continue;
    if (!best || kv.second.last_seen_ms > best->last_seen_ms) best = &kv.second;
  }
  if (!best) return std::nullopt;
  return best->endpoint;
}

bool ServiceBrowser::take_new_peer() {
  const bool v = new_peer_;
  new_peer_ = false;
  return v;
}

// ---------- ServiceAdvertiser ----------

ServiceAdvertiser::ServiceAdvertiser(DiscoveryConfig cfg, std::string name, uint16_t tcp_port, Logger log)
: cfg_(std::move(cfg)), name_(std::move(name)), tcp_port_(tcp_port), log_(or_null(std::move(log))) {}

ServiceAdvertiser::~ServiceAdvertiser() { close(); }

void ServiceAdvertiser::close() {
  if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

Beacon ServiceAdvertiser::beacon() const {
  Beacon b;
  b.service = cfg_.service;
  b.name    = name_;
  b.port    = tcp_port_;
  b.ttl_s   = cfg_.ttl_s;
  return b;
}

bool ServiceAdvertiser::open_socket() {
  fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (fd_ < 0) {
    log_->warn("discovery: advertiser socket failed: {}", net::last_error());
    return false;
  }
  unsigned char ttl  = 1;                          // stay on the local segment
  unsigned char loop = 1;                          // same-host browsers hear us too
  ::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
  ::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop));
  if (!net::set_non_blocking(fd_)) {
    log_->warn("discovery: advertiser non-blocking failed: {}", net::last_error());
    close();
    return false;
  }
  log_->info("discovery: advertising '{}' port {} on {}:{}", name_, tcp_port_, cfg_.group, cfg_.port);
  return true;
}

void ServiceAdvertiser::poll(uint64_t now_ms) {
  if (now_ms < next_beacon_ms_) return;
  next_beacon_ms_ = now_ms + cfg_.beacon_interval_ms;

  if (fd_ < 0 && !open_socket()) return;

  sockaddr_in dst{};
  dst.sin_family = AF_INET;
  dst.sin_port   = htons(cfg_.port);
  if (::inet_pton(AF_INET, cfg_.group.c_str(), &dst.sin_addr) != 1) {
    log_->error("discovery: invalid multicast group '{}'", cfg_.group);
    return;
  }

  const std::string payload = encode_beacon(beacon());
  const ssize_t n = ::sendto(fd_, payload.data(), payload.size(), 0,
                             reinterpret_cast<sockaddr*>(&dst), sizeof(dst));
  if (n < 0) {
    log_->debug("discovery: beacon send failed: {}", net::last_error());
    return;
  }
  ++sent_;
}

} // namespace cuelink::transport
