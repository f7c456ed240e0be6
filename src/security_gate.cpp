// -----------------------------------------------------------------------------
// security_gate.cpp — SecurityGate implementation
//
// API & policy:
//   see include/cuelink/security_gate.hpp
//
// NOTE: every public entry point takes mu_ once. Logging happens under the
// lock; spdlog sinks are thread-safe and the gate is never re-entered.
// -----------------------------------------------------------------------------
#include "cuelink/security_gate.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

#include "cuelink/framer.hpp"

namespace cuelink {

using json = nlohmann::json;

SecurityGate::SecurityGate(SecurityLimits limits, Logger log)
: limits_(limits), log_(or_null(std::move(log))) {
  // PRE: limits must fit the fixed ledgers
  limits_.max_connection_attempts =
      std::min<uint32_t>(limits_.max_connection_attempts, static_cast<uint32_t>(MAX_ATTEMPT_SLOTS));
  limits_.max_messages =
      std::min<uint32_t>(limits_.max_messages, static_cast<uint32_t>(MAX_MESSAGE_SLOTS));
}

std::string SecurityGate::fingerprint(TransportKind kind, const std::string& host) {
  const std::string key = std::string(to_string(kind)) + ":" + host;
  uint64_t h = 0xcbf29ce484222325ull;             // FNV-1a 64 offset basis
  for (unsigned char c : key) {
    h ^= c;
    h *= 0x100000001b3ull;                        // FNV-1a 64 prime
  }
  char out[17];
  std::snprintf(out, sizeof(out), "%016llx", static_cast<unsigned long long>(h));
  return out;
}

// admit(): slide the window, then record now_ms if there is room.
template <typename Deque>
bool SecurityGate::admit(Deque& q, uint64_t now_ms, uint32_t window_ms, uint32_t limit) {
  while (!q.empty() && q.front() + window_ms <= now_ms) q.pop_front();
  if (q.size() >= limit || q.full()) return false;
  q.push_back(now_ms);
  return true;
}

bool SecurityGate::allow_connection(const std::string& fp, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  Ledger& l = ledgers_[fp];
  l.last_seen_ms = now_ms;
  if (admit(l.attempts, now_ms, limits_.connection_window_ms, limits_.max_connection_attempts))
    return true;
  ++rate_limited_;
  log_->warn("security: {} peer={} connection attempts over {}/{}ms",
             to_string(SecurityError::RateLimited), fp,
             limits_.max_connection_attempts, limits_.connection_window_ms);
  return false;
}

bool SecurityGate::allow_message(const std::string& fp, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  Ledger& l = ledgers_[fp];
  l.last_seen_ms = now_ms;
  if (admit(l.messages, now_ms, limits_.message_window_ms, limits_.max_messages))
    return true;
  ++rate_limited_;
  log_->warn("security: {} peer={} messages over {}/{}ms",
             to_string(SecurityError::RateLimited), fp,
             limits_.max_messages, limits_.message_window_ms);
  return false;
}

std::optional<Message> SecurityGate::validate(const json& obj) const {
  auto m = decode(obj);
  if (!m) return std::nullopt;
  if (const auto* b = std::get_if<BatchMessage>(&*m)) {
    if (b->messages.size() > limits_.max_batch_entries) {
      log_->warn("security: {} batch of {} entries exceeds {}",
                 to_string(SecurityError::ValidationFailed),
                 b->messages.size(), limits_.max_batch_entries);
      return std::nullopt;
    }
  }
  return m;
}

Inspection SecurityGate::inspect(const std::string& fp, const json& obj, uint64_t now_ms,
                                 bool rate_limit) {
  Inspection out;

  if (rate_limit && !allow_message(fp, now_ms)) {
    out.dropped = 1;
    out.error   = SecurityError::RateLimited;
    return out;
  }

  auto note_invalid = [&](const char* what) {
    if (out.error == SecurityError::None) out.error = SecurityError::ValidationFailed;
    ++out.dropped;
    {
      std::lock_guard<std::mutex> lock(mu_);
      ++invalid_;
    }
    log_->warn("security: {} peer={} {}", to_string(SecurityError::ValidationFailed), fp, what);
  };

  auto m = validate(obj);
  if (!m) {
    note_invalid("message rejected");
    return out;
  }

  auto* batch = std::get_if<BatchMessage>(&*m);
  if (!batch) {
    out.accepted.push_back(std::move(*m));
    return out;
  }

  // Batch: each entry stands alone.
  out.accepted.reserve(batch->messages.size());
  for (const auto& entry : batch->messages) {
    ProtocolError why = ProtocolError::None;
    auto inner = MessageFramer::parse_object(entry, why);
    if (!inner) { note_invalid("batch entry is not a JSON object"); continue; }
    auto im = validate(*inner);
    if (!im) { note_invalid("batch entry rejected"); continue; }
    if (kind_of(*im) == MessageKind::Batch) { note_invalid("nested batch"); continue; }
    out.accepted.push_back(std::move(*im));
  }
  return out;
}

void SecurityGate::collect_garbage(uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  const uint64_t horizon =
      2ull * std::max(limits_.connection_window_ms, limits_.message_window_ms);
  size_t removed = 0;
  for (auto it = ledgers_.begin(); it != ledgers_.end();) {
    if (it->second.last_seen_ms + horizon <= now_ms) {
      it = ledgers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed) log_->debug("security: gc removed {} idle ledgers", removed);
}

void SecurityGate::clear(const std::string& fp) {
  std::lock_guard<std::mutex> lock(mu_);
  ledgers_.erase(fp);
}

SecurityStats SecurityGate::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  SecurityStats s;
  s.tracked_peers = ledgers_.size();
  for (const auto& kv : ledgers_) {
    s.connection_entries += kv.second.attempts.size();
    s.message_entries    += kv.second.messages.size();
  }
  s.rate_limited = rate_limited_;
  s.invalid      = invalid_;
  return s;
}

} // namespace cuelink
