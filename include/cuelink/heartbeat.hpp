#pragma once
/**
 * @file heartbeat.hpp
 * @brief Heartbeat emission schedule and receive-side liveness check.
 *
 * @details
 * - Emission: a heartbeat is due every `interval_ms` while Active.
 * - Liveness: counted from the last *received* byte of any kind, not only
 *   heartbeats. Silence longer than `stale_after_ms` means stale.
 * - Quality: Connected below half the threshold, Degraded above it.
 *
 * Sends refresh the connection's activity stamp (kept by the Transport) but
 * never the liveness clock: a peer that only hears us is still dead to us.
 */

#include <cstdint>

namespace cuelink {

enum class LinkQuality : uint8_t { Disconnected, Connecting, Connected, Degraded };

const char* to_string(LinkQuality q);

class HeartbeatMonitor {
public:
  HeartbeatMonitor(uint32_t interval_ms, uint32_t stale_after_ms)
  : interval_ms_(interval_ms), stale_after_ms_(stale_after_ms) {}

  /// Start a fresh window (handshake just completed).
  void reset(uint64_t now_ms) { last_rx_ms_ = now_ms; last_tx_hb_ms_ = now_ms; }

  void on_receive(uint64_t now_ms) { last_rx_ms_ = now_ms; }
  void on_heartbeat_sent(uint64_t now_ms) { last_tx_hb_ms_ = now_ms; }

  bool heartbeat_due(uint64_t now_ms) const;
  bool is_stale(uint64_t now_ms) const;
  LinkQuality quality(uint64_t now_ms) const;

  uint64_t silence_ms(uint64_t now_ms) const {
    return now_ms > last_rx_ms_ ? now_ms - last_rx_ms_ : 0;
  }

  uint32_t interval_ms() const    { return interval_ms_; }
  uint32_t stale_after_ms() const { return stale_after_ms_; }
  uint64_t last_rx_ms() const     { return last_rx_ms_; }

private:
  uint32_t interval_ms_;
  uint32_t stale_after_ms_;
  uint64_t last_rx_ms_{0};
  uint64_t last_tx_hb_ms_{0};
};

} // namespace cuelink
