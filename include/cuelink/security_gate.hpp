#pragma once
/**
 * @file security_gate.hpp
 * @brief Ingress rate limiting and payload validation.
 *
 * @details
 * ## Limiters (per peer fingerprint)
 * - connection attempts: at most `max_connection_attempts` per `connection_window_ms`
 * - messages:            at most `max_messages` per `message_window_ms`
 *
 * Both are sliding windows over stored timestamps. A refused attempt or
 * message is not recorded, so a flood cannot extend its own ban.
 *
 * ## Validation
 * Dispatch by `type` through the whitelist in `decode()` (message.hpp), then
 * range checks. Batches are exploded and every inner entry is validated on
 * its own. A batch with more than `max_batch_entries` entries is rejected
 * whole. A batch inside a batch is rejected.
 *
 * ## Failure posture
 * Silent: violations are logged here and the message is dropped. Nothing is
 * sent back to the peer.
 *
 * Thread-safe: one mutex guards all ledgers. Two transports share one gate.
 */

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "etl/deque.h"
#include "nlohmann/json.hpp"

#include "cuelink/connection.hpp"
#include "cuelink/errors.hpp"
#include "cuelink/logging.hpp"
#include "cuelink/message.hpp"

namespace cuelink {

struct SecurityLimits {
  uint32_t max_connection_attempts{20};
  uint32_t connection_window_ms{60000};
  uint32_t max_messages{100};
  uint32_t message_window_ms{1000};
  size_t   max_batch_entries{50};
};

struct SecurityStats {
  size_t   tracked_peers{0};
  size_t   connection_entries{0};
  size_t   message_entries{0};
  uint64_t rate_limited{0};
  uint64_t invalid{0};
};

/// Outcome of inspecting one inbound JSON object.
struct Inspection {
  std::vector<Message> accepted;                  // batch entries flattened, in order
  size_t               dropped{0};
  SecurityError        error{SecurityError::None}; // first error seen
};

class SecurityGate {
public:
  static constexpr size_t MAX_ATTEMPT_SLOTS = 64;   ///< upper bound for max_connection_attempts
  static constexpr size_t MAX_MESSAGE_SLOTS = 512;  ///< upper bound for max_messages

  explicit SecurityGate(SecurityLimits limits = {}, Logger log = nullptr);

  /// Hex FNV-1a-64 of "<kind>:<host>".
  static std::string fingerprint(TransportKind kind, const std::string& host);

  bool allow_connection(const std::string& fp, uint64_t now_ms);
  bool allow_message(const std::string& fp, uint64_t now_ms);

  /**
   * @brief Whitelist + range check one object. Stateless.
   * @return the decoded message, or nullopt if it must be dropped. A batch
   *         comes back still packed (entries not yet checked).
   */
  std::optional<Message> validate(const nlohmann::json& obj) const;

  /// Rate-limit, validate and unbatch one inbound object. With
  /// `rate_limit` false only validation and unbatching run.
  Inspection inspect(const std::string& fp, const nlohmann::json& obj, uint64_t now_ms,
                     bool rate_limit = true);

  /// Drop ledgers idle for two windows.
  void collect_garbage(uint64_t now_ms);
  /// Forget one peer (manual reconnect).
  void clear(const std::string& fp);

  SecurityStats stats() const;
  const SecurityLimits& limits() const { return limits_; }

private:
  struct Ledger {
    etl::deque<uint64_t, MAX_ATTEMPT_SLOTS> attempts;
    etl::deque<uint64_t, MAX_MESSAGE_SLOTS> messages;
    uint64_t last_seen_ms{0};
  };

  template <typename Deque>
  static bool admit(Deque& q, uint64_t now_ms, uint32_t window_ms, uint32_t limit);

  SecurityLimits limits_;
  Logger         log_;

  mutable std::mutex                      mu_;
  std::unordered_map<std::string, Ledger> ledgers_;
  uint64_t                                rate_limited_{0};
  uint64_t                                invalid_{0};
};

} // namespace cuelink
