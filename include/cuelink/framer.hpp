#pragma once
/**
 * @file framer.hpp
 * @brief Newline-delimited JSON framing, the receive-side line splitter and
 *        the sender-side OutgoingBatch.
 *
 * @details
 * ## Frames
 * One JSON object per physical send, terminated by a single `\n`. A CR before
 * the LF is tolerated on receive. Handshake lines use the same splitter.
 *
 * ## Batching (send side)
 * ```
 *   enqueue ──► OutgoingBatch ──► flush when: size >= batch_size
 *                                           or now >= first_enqueue + batch_timeout
 *                                           or size == MAX_BATCH_SIZE (forced)
 * ```
 * One entry is framed as itself; two or more become
 * `{"type":"batch","messages":[...],"count":n,"timestamp":t}`.
 *
 * The batch never holds more than `MAX_BATCH_SIZE` entries. The container is
 * fixed-capacity (ETL) so that bound is structural, not a runtime check.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "etl/vector.h"
#include "nlohmann/json.hpp"

#include "cuelink/errors.hpp"
#include "cuelink/message.hpp"

namespace cuelink {

struct BatchPolicy {
  size_t   batch_size{5};          ///< flush when this many are queued
  uint32_t batch_timeout_ms{10};   ///< flush this long after the first enqueue
};

class MessageFramer {
public:
  /// Serialized message + '\n'.
  static std::string frame(const Message& m);
  /// One already-serialized entry + '\n'.
  static std::string frame_serialized(const std::string& serialized);
  /// Batch envelope over serialized entries + '\n'.
  static std::string frame_batch(const std::vector<std::string>& serialized, double timestamp);

  /**
   * @brief Parse one line as a JSON object.
   * @return nullopt (why = MalformedFrame) for non-JSON or non-object lines.
   */
  static std::optional<nlohmann::json> parse_object(const std::string& line, ProtocolError& why);
};

/**
 * @brief Accumulates raw bytes and yields complete lines.
 *
 * Bounded: a line that grows past `max_line` bytes without a newline is
 * discarded (MalformedFrame) and the splitter skips ahead to the next '\n'.
 */
class LineSplitter {
public:
  static constexpr size_t DEFAULT_MAX_LINE = 64 * 1024;

  explicit LineSplitter(size_t max_line = DEFAULT_MAX_LINE) : max_line_(max_line) {}

  void feed(const uint8_t* data, size_t len);
  /// Pop the next complete line (without CR/LF). False when none is ready.
  bool next_line(std::string& out);
  void clear();

  /// Number of oversized lines dropped since construction/clear.
  size_t overflows() const { return overflows_; }
  size_t buffered() const  { return buf_.size(); }

private:
  std::string buf_;
  size_t      max_line_;
  size_t      overflows_{0};
  bool        skipping_{false};   // inside an oversized line, waiting for '\n'
};

/**
 * @brief Ordered accumulator for one connection's outbound messages.
 *
 * Owned by a single Transport and touched only on its I/O thread.
 */
class OutgoingBatch {
public:
  static constexpr size_t MAX_BATCH_SIZE = 100;
  using Entries = etl::vector<std::string, MAX_BATCH_SIZE>;

  explicit OutgoingBatch(BatchPolicy policy = {}) : policy_(policy) {}

  /**
   * @brief Append a serialized message.
   * @return false if the batch is already at MAX_BATCH_SIZE (caller must
   *         flush first).
   */
  bool push(std::string serialized, uint64_t now_ms);

  bool empty() const { return entries_.empty(); }
  bool full() const  { return entries_.full(); }
  size_t size() const { return entries_.size(); }

  /// Size or timer trigger reached (not counting the forced cap).
  bool due(uint64_t now_ms) const;
  uint64_t created_ms() const  { return created_ms_; }
  uint64_t deadline_ms() const { return created_ms_ + policy_.batch_timeout_ms; }

  /// Move all entries out as one frame (single message or batch envelope).
  std::string take_frame(double timestamp);
  void clear() { entries_.clear(); created_ms_ = 0; }

  const BatchPolicy& policy() const { return policy_; }

private:
  BatchPolicy policy_;
  Entries     entries_;
  uint64_t    created_ms_{0};
};

} // namespace cuelink
