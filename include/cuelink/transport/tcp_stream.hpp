#pragma once
/**
 * @file tcp_stream.hpp
 * @brief POSIX TCP stream + small socket helpers (Linux/macOS).
 *
 * Sockets are non-blocking with TCP_NODELAY; sends use MSG_NOSIGNAL so a
 * vanished peer shows up as an error code instead of SIGPIPE.
 */

#include <cstdint>
#include <string>

#include "cuelink/transport/transport_base.hpp"

namespace cuelink::transport {

namespace net {
bool        set_non_blocking(int fd);
void        set_no_delay(int fd);
/// Numeric host of the remote side; empty on failure.
std::string peer_host(int fd, uint16_t& port_out);
/// errno text for log lines.
std::string last_error();
/// Blocking name lookup; first address as numeric text. Startup use only.
bool        resolve_host(const std::string& host, std::string& numeric_out, std::string& err);
} // namespace net

class TcpStream : public IStream {
public:
  /// Takes ownership of a connected socket.
  TcpStream(int fd, Endpoint peer);
  ~TcpStream() override;

  TcpStream(const TcpStream&) = delete;
  TcpStream& operator=(const TcpStream&) = delete;

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override;
  TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) override;
  void close() override;
  const Endpoint& peer() const override { return peer_; }

  int fd() const { return fd_; }

private:
  int      fd_{-1};
  Endpoint peer_;
};

} // namespace cuelink::transport
