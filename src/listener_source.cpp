// -----------------------------------------------------------------------------
// listener_source.cpp — TcpListenerSource
// -----------------------------------------------------------------------------
#include "cuelink/transport/listener_source.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>

#include "cuelink/transport/tcp_stream.hpp"

namespace cuelink::transport {

TcpListenerSource::TcpListenerSource(TransportKind kind, ListenerConfig cfg,
                                     std::unique_ptr<ServiceAdvertiser> advertiser, Logger log)
: kind_(kind), cfg_(std::move(cfg)), advertiser_(std::move(advertiser)), log_(or_null(std::move(log))) {}

TcpListenerSource::~TcpListenerSource() { close(); }

bool TcpListenerSource::open_listener() {
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    log_->error("{}: socket failed: {}", to_string(kind_), net::last_error());
    return false;
  }

  int reuse = 1;
  ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));  // fast rebind after restart

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(cfg_.port);
  if (cfg_.bind_host.empty() || cfg_.bind_host == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, cfg_.bind_host.c_str(), &addr.sin_addr) != 1) {
    log_->error("{}: invalid bind address '{}'", to_string(kind_), cfg_.bind_host);
    close();
    return false;
  }

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
      ::listen(fd_, cfg_.backlog) < 0 ||
      !net::set_non_blocking(fd_)) {
    log_->error("{}: {} {}:{}: {}", to_string(kind_), to_string(TransportError::BindFailed),
                cfg_.bind_host, cfg_.port, net::last_error());
    ::close(fd_);
    fd_ = -1;
    return false;
  }

  log_->info("{}: listening on {}:{}", to_string(kind_), cfg_.bind_host, bound_port());
  return true;
}

SourceEvent TcpListenerSource::poll(uint64_t now_ms, bool may_connect) {
  if (advertiser_) advertiser_->poll(now_ms);     // beacons keep flowing while connected
  if (!may_connect) return SourceEvent::none();

  if (fd_ < 0 && !open_listener()) {
    return SourceEvent::failed(TransportError::BindFailed,
                               Endpoint{kind_, cfg_.bind_host, cfg_.port, {}});
  }

  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  const int client = ::accept(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
  if (client < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED)
      return SourceEvent::none();
    log_->warn("{}: {}: {}", to_string(kind_), to_string(TransportError::AcceptFailed), net::last_error());
    return SourceEvent::failed(TransportError::AcceptFailed);
  }

  Endpoint peer;
  peer.kind = kind_;
  peer.host = net::peer_host(client, peer.port);
  auto stream = std::make_unique<TcpStream>(client, peer);
  log_->debug("{}: accepted {}", to_string(kind_), peer.address());
  return SourceEvent::connected(std::move(stream));
}

void TcpListenerSource::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  if (advertiser_) advertiser_->close();
}

uint16_t TcpListenerSource::bound_port() const {
  if (fd_ < 0) return 0;
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
  return ntohs(addr.sin_port);
}

} // namespace cuelink::transport
