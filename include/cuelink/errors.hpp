#pragma once
/**
 * @file errors.hpp
 * @brief Error taxonomy for the connection layer.
 *
 * @details
 * Four families, each a small enum with a stable string name for log lines:
 *
 * | family          | raised by                     | recovery                          |
 * |-----------------|-------------------------------|-----------------------------------|
 * | TransportError  | socket sources and streams    | ReconnectionScheduler             |
 * | ProtocolError   | HandshakeCodec, MessageFramer | drop the line / frame             |
 * | SecurityError   | SecurityGate                  | drop silently, log locally        |
 * | LivenessError   | HeartbeatMonitor              | ReconnectionScheduler             |
 *
 * None of these is ever thrown across a `poll()` or `tick()` boundary and none
 * of them ends the process. They travel as return values and log fields.
 */

#include <cstdint>

namespace cuelink {

enum class TransportError : uint8_t {
  None = 0,
  BindFailed,
  AcceptFailed,
  ConnectFailed,
  SendFailed,
  ReceiveFailed,
};

enum class ProtocolError : uint8_t {
  None = 0,
  MalformedHandshake,
  UnsupportedVersion,
  MalformedFrame,
};

enum class SecurityError : uint8_t {
  None = 0,
  RateLimited,
  ValidationFailed,
};

enum class LivenessError : uint8_t {
  None = 0,
  StaleConnection,
};

const char* to_string(TransportError e);
const char* to_string(ProtocolError e);
const char* to_string(SecurityError e);
const char* to_string(LivenessError e);

} // namespace cuelink
