// -----------------------------------------------------------------------------
// reconnect.cpp — ReconnectionScheduler
// -----------------------------------------------------------------------------
#include "cuelink/reconnect.hpp"

#include <limits>

namespace cuelink {

uint32_t ReconnectionScheduler::delay_for(uint32_t k) {
  if (k <= SHORT_UNTIL)  return SHORT_DELAY_MS;
  if (k <= MEDIUM_UNTIL) return MEDIUM_DELAY_MS;
  return LONG_DELAY_MS;
}

uint32_t ReconnectionScheduler::on_failure(uint64_t now_ms) {
  if (failures_ < std::numeric_limits<uint32_t>::max()) ++failures_;  // saturate, never wrap back to 1 s
  const uint32_t d = delay_for(failures_);
  deadline_ms_ = now_ms + d;
  pending_     = true;
  return d;
}

void ReconnectionScheduler::schedule_fixed(uint64_t now_ms, uint32_t delay_ms) {
  deadline_ms_ = now_ms + delay_ms;
  pending_     = true;
}

void ReconnectionScheduler::reset() {
  failures_ = 0;
  pending_  = false;
}

void ReconnectionScheduler::peer_available() {
  pending_ = false;                               // counter kept; only a handshake resets it
}

} // namespace cuelink
