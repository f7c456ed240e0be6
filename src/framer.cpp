// -----------------------------------------------------------------------------
// framer.cpp — MessageFramer, LineSplitter, OutgoingBatch
//
// API & policy:
//   see include/cuelink/framer.hpp
// -----------------------------------------------------------------------------
#include "cuelink/framer.hpp"

#include <utility>

namespace cuelink {

using json = nlohmann::json;

// ---------- MessageFramer ----------

std::string MessageFramer::frame(const Message& m) {
  std::string s = serialize(m);
  s += '\n';
  return s;
}

std::string MessageFramer::frame_serialized(const std::string& serialized) {
  std::string s;
  s.reserve(serialized.size() + 1);
  s += serialized;
  s += '\n';
  return s;
}

std::string MessageFramer::frame_batch(const std::vector<std::string>& serialized, double timestamp) {
  BatchMessage b;
  b.messages  = serialized;
  b.timestamp = timestamp;
  return frame(Message{std::move(b)});
}

std::optional<json> MessageFramer::parse_object(const std::string& line, ProtocolError& why) {
  why = ProtocolError::None;
  // allow_exceptions=false: a parse failure yields a discarded value instead of throwing
  json j = json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    why = ProtocolError::MalformedFrame;
    return std::nullopt;
  }
  return j;
}

// ---------- LineSplitter ----------

void LineSplitter::feed(const uint8_t* data, size_t len) {
  if (!data || !len) return;
  for (size_t i = 0; i < len; ++i) {
    const char c = static_cast<char>(data[i]);
    if (skipping_) {                      // discard until the end of the oversized line
      if (c == '\n') skipping_ = false;
      continue;
    }
    buf_ += c;
    if (c != '\n' && buf_.size() > max_line_) {
      // POLICY: drop only the unterminated tail; complete lines already buffered survive
      const auto last_nl = buf_.rfind('\n');
      buf_.erase(last_nl == std::string::npos ? 0 : last_nl + 1);
      skipping_ = true;
      ++overflows_;
    }
  }
}

bool LineSplitter::next_line(std::string& out) {
  const auto nl = buf_.find('\n');
  if (nl == std::string::npos) return false;
  size_t end = nl;
  if (end > 0 && buf_[end - 1] == '\r') --end;   // tolerate CRLF
  out.assign(buf_, 0, end);
  buf_.erase(0, nl + 1);
  return true;
}

void LineSplitter::clear() {
  buf_.clear();
  overflows_ = 0;
  skipping_  = false;
}

// ---------- OutgoingBatch ----------

bool OutgoingBatch::push(std::string serialized, uint64_t now_ms) {
  if (entries_.full()) return false;
  if (entries_.empty()) created_ms_ = now_ms;    // timer starts at first enqueue
  entries_.push_back(std::move(serialized));
  return true;
}

bool OutgoingBatch::due(uint64_t now_ms) const {
  if (entries_.empty()) return false;
  if (entries_.size() >= policy_.batch_size) return true;
  return now_ms >= deadline_ms();
}

std::string OutgoingBatch::take_frame(double timestamp) {
  std::string frame;
  if (entries_.size() == 1) {
    frame = MessageFramer::frame_serialized(entries_.front());
  } else if (!entries_.empty()) {
    std::vector<std::string> items;
    items.reserve(entries_.size());
    for (auto& e : entries_) items.push_back(std::move(e));
    frame = MessageFramer::frame_batch(items, timestamp);
  }
  clear();
  return frame;
}

} // namespace cuelink
