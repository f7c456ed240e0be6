#pragma once
/**
 * @file clock.hpp
 * @brief Injectable time source for every timer in the connection layer.
 *
 * @details
 * All deadlines (handshake timeout, batch flush, heartbeat, liveness, backoff)
 * are plain `uint64_t` millisecond values compared against `now_ms()`. Nothing
 * sleeps on a timer; owners evaluate their deadlines when they are polled.
 *
 * - `SteadyClock` is the production source (monotonic ms + wall-clock epoch).
 * - `ManualClock` is advanced by hand so tests can walk through backoff and
 *   liveness windows without waiting.
 */

#include <atomic>
#include <chrono>
#include <cstdint>

namespace cuelink {

class Clock {
public:
  virtual ~Clock() = default;
  /// Monotonic milliseconds. Only differences are meaningful.
  virtual uint64_t now_ms() const = 0;
  /// Wall-clock seconds since the Unix epoch, used for wire `timestamp` fields.
  virtual double epoch_seconds() const = 0;
};

class SteadyClock : public Clock {
public:
  uint64_t now_ms() const override {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
  }

  double epoch_seconds() const override {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
  }
};

/**
 * @brief Hand-driven clock. Safe to advance from a test thread while a
 * transport worker reads it.
 */
class ManualClock : public Clock {
public:
  explicit ManualClock(uint64_t start_ms = 1000, double epoch = 1700000000.0)
  : now_(start_ms), epoch_base_(epoch), start_(start_ms) {}

  uint64_t now_ms() const override { return now_.load(); }

  double epoch_seconds() const override {
    return epoch_base_ + static_cast<double>(now_.load() - start_) / 1000.0;
  }

  void advance(uint64_t ms) { now_ += ms; }
  void set(uint64_t ms)     { now_ = ms; }

private:
  std::atomic<uint64_t> now_;
  double   epoch_base_;
  uint64_t start_;
};

} // namespace cuelink
