#pragma once
/**
 * @file message.hpp
 * @brief Application messages carried after the handshake.
 *
 * @details
 * A `Message` is a tagged variant over the seven wire kinds. Every numeric
 * field is range-checked twice: once by the `make_*` factories when the
 * application builds a message, and again by `decode()` when a JSON object
 * arrives from a peer. Out-of-range input yields an empty optional. Values are
 * never clamped.
 *
 * Wire names (`type` field):
 * ```
 *  midi_cc  midi_note  transport  heartbeat  handshake  batch  midi_input
 * ```
 *
 * `BatchMessage` holds *serialized* inner messages. It is a container for I/O
 * amortization only; its entries are decoded and validated one by one by the
 * receiver (see SecurityGate).
 */

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace cuelink {

// ---------- ranges ----------
static constexpr int CHANNEL_MIN = 1;
static constexpr int CHANNEL_MAX = 16;
static constexpr int DATA7_MAX   = 127;   ///< cc number, note, value, velocity
static constexpr int STATUS_MIN  = 0x80;  ///< lowest channel-voice status byte
static constexpr int STATUS_MAX  = 0xEF;  ///< highest channel-voice status byte

struct CcMessage {
  uint8_t     channel{1};   // 1..16
  uint8_t     number{0};    // 0..127
  uint8_t     value{0};     // 0..127
  std::string label;
  std::string button_id;
};

struct NoteMessage {
  uint8_t     channel{1};
  uint8_t     number{0};
  uint8_t     velocity{0};  // 0 = note off
  std::string label;
  std::string button_id;
};

struct TransportMessage {
  std::string action;       // "play", "stop", "record", ...
  double      timestamp{0};
};

struct HeartbeatMessage {
  double timestamp{0};
};

struct HandshakeMessage {
  int         version{2};
  std::string auth;
  std::string name;
};

struct BatchMessage {
  std::vector<std::string> messages;  // each a complete serialized message
  double                   timestamp{0};
};

/// Raw 3-byte event from the host (DAW feedback such as fader moves).
struct MidiInputMessage {
  uint8_t status{0xB0};
  uint8_t data1{0};
  uint8_t data2{0};

  uint8_t channel() const { return static_cast<uint8_t>((status & 0x0F) + 1); }
  bool is_control_change() const { return (status & 0xF0) == 0xB0; }
  bool is_note_on() const        { return (status & 0xF0) == 0x90; }
  bool is_note_off() const       { return (status & 0xF0) == 0x80; }
};

using Message = std::variant<CcMessage, NoteMessage, TransportMessage, HeartbeatMessage,
                             HandshakeMessage, BatchMessage, MidiInputMessage>;

enum class MessageKind : uint8_t {
  Cc, Note, Transport, Heartbeat, Handshake, Batch, MidiInput
};

// ---------- construction (range-checked) ----------
std::optional<CcMessage>        make_cc(int channel, int number, int value,
                                        std::string label = {}, std::string button_id = {});
std::optional<NoteMessage>      make_note(int channel, int number, int velocity,
                                          std::string label = {}, std::string button_id = {});
std::optional<TransportMessage> make_transport(std::string action, double timestamp);
std::optional<MidiInputMessage> make_midi_input(int status, int data1, int data2);
std::optional<HandshakeMessage> make_handshake(int version, std::string auth, std::string name);

// ---------- introspection ----------
MessageKind kind_of(const Message& m);
const char* type_name(MessageKind k);
std::optional<MessageKind> kind_from_type(const std::string& type);

// ---------- JSON ----------
nlohmann::json to_json(const Message& m);
/// Compact single-line JSON, no trailing newline.
std::string    serialize(const Message& m);

/**
 * @brief Decode one JSON object into a Message.
 *
 * PRE: `obj` is the parsed object. Unknown `type` values, missing required
 * fields, wrong field types and out-of-range values all return nullopt.
 * A batch decodes structurally (array of strings); its entries are NOT
 * decoded here.
 */
std::optional<Message> decode(const nlohmann::json& obj);

} // namespace cuelink
