// -----------------------------------------------------------------------------
// errors.cpp — string names for the error taxonomy (see include/cuelink/errors.hpp)
// -----------------------------------------------------------------------------
#include "cuelink/errors.hpp"

namespace cuelink {

const char* to_string(TransportError e) {
  switch (e) {
    case TransportError::None:          return "none";
    case TransportError::BindFailed:    return "bind-failed";
    case TransportError::AcceptFailed:  return "accept-failed";
    case TransportError::ConnectFailed: return "connect-failed";
    case TransportError::SendFailed:    return "send-failed";
    case TransportError::ReceiveFailed: return "receive-failed";
  }
  return "unknown";
}

const char* to_string(ProtocolError e) {
  switch (e) {
    case ProtocolError::None:               return "none";
    case ProtocolError::MalformedHandshake: return "malformed-handshake";
    case ProtocolError::UnsupportedVersion: return "unsupported-version";
    case ProtocolError::MalformedFrame:     return "malformed-frame";
  }
  return "unknown";
}

const char* to_string(SecurityError e) {
  switch (e) {
    case SecurityError::None:             return "none";
    case SecurityError::RateLimited:      return "rate-limited";
    case SecurityError::ValidationFailed: return "validation-failed";
  }
  return "unknown";
}

const char* to_string(LivenessError e) {
  switch (e) {
    case LivenessError::None:            return "none";
    case LivenessError::StaleConnection: return "stale-connection";
  }
  return "unknown";
}

} // namespace cuelink
