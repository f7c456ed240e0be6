// -----------------------------------------------------------------------------
// heartbeat.cpp — HeartbeatMonitor
// -----------------------------------------------------------------------------
#include "cuelink/heartbeat.hpp"

namespace cuelink {

const char* to_string(LinkQuality q) {
  switch (q) {
    case LinkQuality::Disconnected: return "disconnected";
    case LinkQuality::Connecting:   return "connecting";
    case LinkQuality::Connected:    return "connected";
    case LinkQuality::Degraded:     return "degraded";
  }
  return "unknown";
}

bool HeartbeatMonitor::heartbeat_due(uint64_t now_ms) const {
  if (interval_ms_ == 0) return false;              // emission disabled
  return now_ms >= last_tx_hb_ms_ + interval_ms_;
}

bool HeartbeatMonitor::is_stale(uint64_t now_ms) const {
  if (stale_after_ms_ == 0) return false;           // liveness check disabled
  return silence_ms(now_ms) > stale_after_ms_;
}

LinkQuality HeartbeatMonitor::quality(uint64_t now_ms) const {
  if (is_stale(now_ms)) return LinkQuality::Disconnected;
  if (stale_after_ms_ && silence_ms(now_ms) > stale_after_ms_ / 2) return LinkQuality::Degraded;
  return LinkQuality::Connected;
}

} // namespace cuelink
