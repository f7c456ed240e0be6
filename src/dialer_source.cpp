// -----------------------------------------------------------------------------
// dialer_source.cpp — TcpDialerSource
//
// Connect phases:
//   1) start_connect(): numeric address parse, socket(), non-blocking connect()
//   2) finish_connect(): writable + SO_ERROR == 0 -> Connected
//   3) deadline passed -> abort, connect-failed
// -----------------------------------------------------------------------------
#include "cuelink/transport/dialer_source.hpp"

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "cuelink/transport/tcp_stream.hpp"

namespace cuelink::transport {

TcpDialerSource::TcpDialerSource(TransportKind kind, std::shared_ptr<EndpointProvider> provider,
                                 DialerConfig cfg, Logger log)
: kind_(kind), provider_(std::move(provider)), cfg_(cfg), log_(or_null(std::move(log))) {}

TcpDialerSource::~TcpDialerSource() { abort_connect(); }

SourceEvent TcpDialerSource::poll(uint64_t now_ms, bool may_connect) {
  if (provider_) {
    provider_->poll(now_ms);
    if (provider_->take_new_peer()) appeared_ = true;
  }

  if (fd_ >= 0) return finish_connect(now_ms);     // carry an in-flight dial to completion
  if (!may_connect) return SourceEvent::none();

  std::optional<Endpoint> target = override_;
  if (!target && provider_) target = provider_->current(now_ms);
  if (!target) return SourceEvent::none();          // nothing discovered yet
  return start_connect(*target, now_ms);
}

SourceEvent TcpDialerSource::start_connect(const Endpoint& target, uint64_t now_ms) {
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags    = AI_NUMERICHOST | AI_NUMERICSERV;  // poll() never waits on DNS
  addrinfo* res = nullptr;
  const std::string port = std::to_string(target.port);
  const int rc = ::getaddrinfo(target.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0 || !res) {
    log_->warn("{}: {} is not a numeric address: {}", to_string(kind_), target.address(),
               rc != 0 ? ::gai_strerror(rc) : "no address");
    if (res) ::freeaddrinfo(res);
    return SourceEvent::failed(TransportError::ConnectFailed, target);
  }

  fd_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
  if (fd_ < 0 || !net::set_non_blocking(fd_)) {
    log_->warn("{}: socket failed: {}", to_string(kind_), net::last_error());
    ::freeaddrinfo(res);
    abort_connect();
    return SourceEvent::failed(TransportError::ConnectFailed, target);
  }

  const int c = ::connect(fd_, res->ai_addr, res->ai_addrlen);
  const int err = errno;
  ::freeaddrinfo(res);

  target_      = target;
  deadline_ms_ = now_ms + cfg_.connect_timeout_ms;

  if (c == 0) {                                     // loopback can complete immediately
    const int fd = fd_;
    fd_ = -1;
    log_->debug("{}: connected to {}", to_string(kind_), target_.address());
    return SourceEvent::connected(std::make_unique<TcpStream>(fd, target_));
  }
  if (err != EINPROGRESS && err != EINTR) {
    log_->warn("{}: {} {}: {}", to_string(kind_), to_string(TransportError::ConnectFailed),
               target.address(), std::strerror(err));
    abort_connect();
    return SourceEvent::failed(TransportError::ConnectFailed, target);
  }
  log_->debug("{}: dialing {}", to_string(kind_), target.address());
  return SourceEvent::dialing(target);
}

SourceEvent TcpDialerSource::finish_connect(uint64_t now_ms) {
  pollfd p{};
  p.fd     = fd_;
  p.events = POLLOUT;
  const int r = ::poll(&p, 1, 0);
  if (r == 0) {
    if (now_ms >= deadline_ms_) {
      log_->warn("{}: connect to {} timed out", to_string(kind_), target_.address());
      abort_connect();
      return SourceEvent::failed(TransportError::ConnectFailed, target_);
    }
    return SourceEvent::none();
  }

  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (r < 0 || ::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
    log_->warn("{}: {} {}: {}", to_string(kind_), to_string(TransportError::ConnectFailed),
               target_.address(), so_error ? std::strerror(so_error) : net::last_error());
    abort_connect();
    return SourceEvent::failed(TransportError::ConnectFailed, target_);
  }

  const int fd = fd_;
  fd_ = -1;                                         // ownership moves to the stream
  log_->debug("{}: connected to {}", to_string(kind_), target_.address());
  return SourceEvent::connected(std::make_unique<TcpStream>(fd, target_));
}

void TcpDialerSource::abort_connect() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void TcpDialerSource::close() { abort_connect(); }

bool TcpDialerSource::take_peer_appeared() {
  const bool v = appeared_;
  appeared_ = false;
  return v;
}

bool TcpDialerSource::retarget(const std::optional<Endpoint>& ep) {
  abort_connect();
  override_ = ep;
  if (ep) appeared_ = true;                         // explicit target: retry at once
  return true;
}

} // namespace cuelink::transport
