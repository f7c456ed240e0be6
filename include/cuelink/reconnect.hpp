#pragma once
/**
 * @file reconnect.hpp
 * @brief Per-transport reconnection backoff.
 *
 * @details
 * | consecutive failures k | delay  |
 * |------------------------|--------|
 * | 1 .. 5                 | 1 s    |
 * | 6 .. 15                | 3 s    |
 * | 16 ..                  | 10 s   |
 *
 * There is no attempt ceiling. Either peer may sleep and wake at any time, so
 * retries never stop once started.
 *
 * - `reset()` after a successful handshake zeroes the counter.
 * - `peer_available()` (cable attached, service discovered) cancels a pending
 *   delay so the next poll retries at once. The failure count is kept.
 * - `suppress()` (explicit stop, coordinator hold) blocks retries until
 *   `resume()`.
 *
 * Single-owner: only the Transport's I/O context touches an instance.
 */

#include <cstdint>

namespace cuelink {

class ReconnectionScheduler {
public:
  static constexpr uint32_t SHORT_DELAY_MS  = 1000;
  static constexpr uint32_t MEDIUM_DELAY_MS = 3000;
  static constexpr uint32_t LONG_DELAY_MS   = 10000;
  static constexpr uint32_t SHORT_UNTIL     = 5;    // attempts 1..5
  static constexpr uint32_t MEDIUM_UNTIL    = 15;   // attempts 6..15

  /// Backoff for the k-th consecutive failure (k >= 1).
  static uint32_t delay_for(uint32_t k);

  /// Record a failure and schedule the next attempt. Returns the delay used.
  uint32_t on_failure(uint64_t now_ms);
  /// Schedule a fixed delay without touching the counter (bind collisions).
  void     schedule_fixed(uint64_t now_ms, uint32_t delay_ms);
  /// Handshake succeeded.
  void     reset();
  /// Cancel a pending delay; retry on the next poll.
  void     peer_available();

  void suppress() { suppressed_ = true; }
  void resume()   { suppressed_ = false; }

  /// May the owner attempt (re)connection now?
  bool ready(uint64_t now_ms) const {
    return !suppressed_ && (!pending_ || now_ms >= deadline_ms_);
  }

  bool     pending() const     { return pending_; }
  bool     suppressed() const  { return suppressed_; }
  uint32_t failures() const    { return failures_; }
  uint64_t deadline_ms() const { return deadline_ms_; }

private:
  uint32_t failures_{0};
  uint64_t deadline_ms_{0};
  bool     pending_{false};
  bool     suppressed_{false};
};

} // namespace cuelink
