// -----------------------------------------------------------------------------
// tcp_stream.cpp — non-blocking TCP stream and socket helpers
// -----------------------------------------------------------------------------
#include "cuelink/transport/tcp_stream.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#ifndef MSG_NOSIGNAL
#  define MSG_NOSIGNAL 0   // macOS: SO_NOSIGPIPE is set on the socket instead
#endif

namespace cuelink::transport {

namespace net {

bool set_non_blocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void set_no_delay(int fd) {
  int one = 1;
  ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));  // best effort: latency only
#ifdef SO_NOSIGPIPE
  ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
}

std::string peer_host(int fd, uint16_t& port_out) {
  port_out = 0;
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return {};

  char ip[INET6_ADDRSTRLEN] = {0};
  if (addr.ss_family == AF_INET) {
    auto* s = reinterpret_cast<sockaddr_in*>(&addr);
    ::inet_ntop(AF_INET, &s->sin_addr, ip, sizeof(ip));
    port_out = ntohs(s->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    auto* s = reinterpret_cast<sockaddr_in6*>(&addr);
    ::inet_ntop(AF_INET6, &s->sin6_addr, ip, sizeof(ip));
    port_out = ntohs(s->sin6_port);
  } else {
    return {};
  }
  return ip;
}

std::string last_error() { return std::strerror(errno); }

bool resolve_host(const std::string& host, std::string& numeric_out, std::string& err) {
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* res = nullptr;
  const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || !res) {
    err = "cannot resolve '" + host + "': " + (rc != 0 ? ::gai_strerror(rc) : "no address");
    if (res) ::freeaddrinfo(res);
    return false;
  }
  char buf[NI_MAXHOST];
  const int nrc = ::getnameinfo(res->ai_addr, res->ai_addrlen, buf, sizeof(buf), nullptr, 0,
                                NI_NUMERICHOST);
  ::freeaddrinfo(res);
  if (nrc != 0) {
    err = "cannot format address of '" + host + "': " + ::gai_strerror(nrc);
    return false;
  }
  numeric_out = buf;
  return true;
}

} // namespace net

TcpStream::TcpStream(int fd, Endpoint peer)
: fd_(fd), peer_(std::move(peer)) {
  net::set_non_blocking(fd_);
  net::set_no_delay(fd_);
}

TcpStream::~TcpStream() { close(); }

RxResult TcpStream::recv(uint8_t* out, std::size_t cap, std::size_t& out_len) {
  out_len = 0;
  if (fd_ < 0 || !out || cap == 0) return RxResult::Error;
  const ssize_t n = ::recv(fd_, out, cap, 0);
  if (n > 0) { out_len = static_cast<std::size_t>(n); return RxResult::Ok; }
  if (n == 0) return RxResult::Closed;                      // orderly EOF
  if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return RxResult::None;
  return RxResult::Error;
}

TxResult TcpStream::send(const uint8_t* data, std::size_t len, std::size_t& written) {
  written = 0;
  if (fd_ < 0 || !data || !len) return TxResult::Error;
  const ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
  if (n > 0) { written = static_cast<std::size_t>(n); return TxResult::Ok; }
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return TxResult::Busy;
  return TxResult::Error;
}

void TcpStream::close() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
}

} // namespace cuelink::transport
