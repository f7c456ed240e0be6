// -----------------------------------------------------------------------------
// message.cpp — factories, JSON mapping and decode for cuelink::Message
//
// API & field descriptions:
//   see include/cuelink/message.hpp
//
// Policy: reject, never clamp. Every integer that reaches a struct field has
// already been compared against its range here.
// -----------------------------------------------------------------------------
#include "cuelink/message.hpp"

#include <type_traits>
#include <utility>

namespace cuelink {

using json = nlohmann::json;

namespace {

constexpr int64_t INT_FIELD_LIMIT = 1 << 20;  // anything larger is garbage for every field we read

bool in_range(int v, int lo, int hi) { return v >= lo && v <= hi; }

std::optional<int> int_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number_integer()) return std::nullopt;
  if (it->is_number_unsigned()) {
    const auto u = it->get<uint64_t>();
    if (u > static_cast<uint64_t>(INT_FIELD_LIMIT)) return std::nullopt;
    return static_cast<int>(u);
  }
  const auto s = it->get<int64_t>();
  if (s < -INT_FIELD_LIMIT || s > INT_FIELD_LIMIT) return std::nullopt;
  return static_cast<int>(s);
}

std::string string_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

double number_field(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_number()) return 0.0;
  return it->get<double>();
}

} // namespace

// ---------- construction ----------

std::optional<CcMessage> make_cc(int channel, int number, int value,
                                 std::string label, std::string button_id) {
  if (!in_range(channel, CHANNEL_MIN, CHANNEL_MAX)) return std::nullopt;
  if (!in_range(number, 0, DATA7_MAX))              return std::nullopt;
  if (!in_range(value, 0, DATA7_MAX))               return std::nullopt;
  CcMessage m;
  m.channel   = static_cast<uint8_t>(channel);
  m.number    = static_cast<uint8_t>(number);
  m.value     = static_cast<uint8_t>(value);
  m.label     = std::move(label);
  m.button_id = std::move(button_id);
  return m;
}

std::optional<NoteMessage> make_note(int channel, int number, int velocity,
                                     std::string label, std::string button_id) {
  if (!in_range(channel, CHANNEL_MIN, CHANNEL_MAX)) return std::nullopt;
  if (!in_range(number, 0, DATA7_MAX))              return std::nullopt;
  if (!in_range(velocity, 0, DATA7_MAX))            return std::nullopt;
  NoteMessage m;
  m.channel   = static_cast<uint8_t>(channel);
  m.number    = static_cast<uint8_t>(number);
  m.velocity  = static_cast<uint8_t>(velocity);
  m.label     = std::move(label);
  m.button_id = std::move(button_id);
  return m;
}

std::optional<TransportMessage> make_transport(std::string action, double timestamp) {
  if (action.empty()) return std::nullopt;
  return TransportMessage{std::move(action), timestamp};
}

std::optional<MidiInputMessage> make_midi_input(int status, int data1, int data2) {
  if (!in_range(status, STATUS_MIN, STATUS_MAX)) return std::nullopt;
  if (!in_range(data1, 0, DATA7_MAX))            return std::nullopt;
  if (!in_range(data2, 0, DATA7_MAX))            return std::nullopt;
  MidiInputMessage m;
  m.status = static_cast<uint8_t>(status);
  m.data1  = static_cast<uint8_t>(data1);
  m.data2  = static_cast<uint8_t>(data2);
  return m;
}

std::optional<HandshakeMessage> make_handshake(int version, std::string auth, std::string name) {
  if (version < 1) return std::nullopt;
  return HandshakeMessage{version, std::move(auth), std::move(name)};
}

// ---------- introspection ----------

MessageKind kind_of(const Message& m) {
  return static_cast<MessageKind>(m.index());  // variant order mirrors MessageKind
}

const char* type_name(MessageKind k) {
  switch (k) {
    case MessageKind::Cc:        return "midi_cc";
    case MessageKind::Note:      return "midi_note";
    case MessageKind::Transport: return "transport";
    case MessageKind::Heartbeat: return "heartbeat";
    case MessageKind::Handshake: return "handshake";
    case MessageKind::Batch:     return "batch";
    case MessageKind::MidiInput: return "midi_input";
  }
  return "unknown";
}

std::optional<MessageKind> kind_from_type(const std::string& type) {
  if (type == "midi_cc")    return MessageKind::Cc;
  if (type == "midi_note")  return MessageKind::Note;
  if (type == "transport")  return MessageKind::Transport;
  if (type == "heartbeat")  return MessageKind::Heartbeat;
  if (type == "handshake")  return MessageKind::Handshake;
  if (type == "batch")      return MessageKind::Batch;
  if (type == "midi_input") return MessageKind::MidiInput;
  return std::nullopt;
}

// ---------- JSON ----------

json to_json(const Message& m) {
  json j;
  j["type"] = type_name(kind_of(m));
  std::visit([&j](const auto& v) {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, CcMessage>) {
      j["channel"]   = v.channel;
      j["cc"]        = v.number;
      j["value"]     = v.value;
      j["label"]     = v.label;
      j["button_id"] = v.button_id;
    } else if constexpr (std::is_same_v<T, NoteMessage>) {
      j["channel"]   = v.channel;
      j["note"]      = v.number;
      j["velocity"]  = v.velocity;
      j["label"]     = v.label;
      j["button_id"] = v.button_id;
    } else if constexpr (std::is_same_v<T, TransportMessage>) {
      j["action"]    = v.action;
      j["timestamp"] = v.timestamp;
    } else if constexpr (std::is_same_v<T, HeartbeatMessage>) {
      j["timestamp"] = v.timestamp;
    } else if constexpr (std::is_same_v<T, HandshakeMessage>) {
      j["version"] = v.version;
      j["auth"]    = v.auth;
      j["name"]    = v.name;
    } else if constexpr (std::is_same_v<T, BatchMessage>) {
      j["messages"]  = v.messages;
      j["count"]     = v.messages.size();
      j["timestamp"] = v.timestamp;
    } else if constexpr (std::is_same_v<T, MidiInputMessage>) {
      j["midi"] = json::array({v.status, v.data1, v.data2});
    }
  }, m);
  return j;
}

// Invalid UTF-8 in caller strings becomes U+FFFD instead of throwing.
std::string serialize(const Message& m) {
  return to_json(m).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<Message> decode(const json& obj) {
  if (!obj.is_object()) return std::nullopt;
  auto t = obj.find("type");
  if (t == obj.end() || !t->is_string()) return std::nullopt;
  const auto kind = kind_from_type(t->get<std::string>());
  if (!kind) return std::nullopt;  // not on the whitelist

  switch (*kind) {
    case MessageKind::Cc: {
      auto ch = int_field(obj, "channel");
      auto cc = int_field(obj, "cc");
      auto v  = int_field(obj, "value");
      if (!ch || !cc || !v) return std::nullopt;
      auto m = make_cc(*ch, *cc, *v, string_field(obj, "label"), string_field(obj, "button_id"));
      if (!m) return std::nullopt;
      return Message{std::move(*m)};
    }
    case MessageKind::Note: {
      auto ch  = int_field(obj, "channel");
      auto n   = int_field(obj, "note");
      auto vel = int_field(obj, "velocity");
      if (!ch || !n || !vel) return std::nullopt;
      auto m = make_note(*ch, *n, *vel, string_field(obj, "label"), string_field(obj, "button_id"));
      if (!m) return std::nullopt;
      return Message{std::move(*m)};
    }
    case MessageKind::Transport: {
      auto m = make_transport(string_field(obj, "action"), number_field(obj, "timestamp"));
      if (!m) return std::nullopt;
      return Message{std::move(*m)};
    }
    case MessageKind::Heartbeat:
      return Message{HeartbeatMessage{number_field(obj, "timestamp")}};
    case MessageKind::Handshake: {
      int version = 1;
      if (obj.contains("version")) {
        auto v = int_field(obj, "version");
        if (!v) return std::nullopt;
        version = *v;
      }
      auto m = make_handshake(version, string_field(obj, "auth"), string_field(obj, "name"));
      if (!m) return std::nullopt;
      return Message{std::move(*m)};
    }
    case MessageKind::Batch: {
      auto it = obj.find("messages");
      if (it == obj.end() || !it->is_array()) return std::nullopt;
      BatchMessage b;
      b.timestamp = number_field(obj, "timestamp");
      b.messages.reserve(it->size());
      for (const auto& e : *it) {
        if (!e.is_string()) return std::nullopt;
        b.messages.push_back(e.get<std::string>());
      }
      return Message{std::move(b)};
    }
    case MessageKind::MidiInput: {
      auto it = obj.find("midi");
      if (it == obj.end() || !it->is_array() || it->size() != 3) return std::nullopt;
      int bytes[3] = {0, 0, 0};
      for (size_t i = 0; i < 3; ++i) {
        const auto& b = (*it)[i];
        if (!b.is_number_integer()) return std::nullopt;
        const auto v = b.get<int64_t>();
        if (v < 0 || v > 0xFF) return std::nullopt;
        bytes[i] = static_cast<int>(v);
      }
      auto m = make_midi_input(bytes[0], bytes[1], bytes[2]);
      if (!m) return std::nullopt;
      return Message{*m};
    }
  }
  return std::nullopt;
}

} // namespace cuelink
