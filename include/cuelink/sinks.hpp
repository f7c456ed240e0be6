#pragma once
/**
 * @file sinks.hpp
 * @brief Interfaces to the collaborators around the connection layer.
 *
 * - `MidiSink`: the MIDI engine. Receives validated events. Called on a
 *   transport I/O thread, so implementations must be thread-safe.
 * - `StatusObserver`: the application layer. Receives the coarse status
 *   whenever it changes, on the thread that runs `Coordinator::tick()`.
 * - `DeviceEventSource` / `DeviceEventListener`: cable attach/detach
 *   notifications (USB mux), used to skip the tunnel's backoff.
 */

#include <string>

#include "cuelink/connection.hpp"
#include "cuelink/heartbeat.hpp"
#include "cuelink/message.hpp"

namespace cuelink {

class MidiSink {
public:
  virtual ~MidiSink() = default;
  virtual void on_control_change(const CcMessage& cc) = 0;
  virtual void on_note(const NoteMessage& note) = 0;
  virtual void on_transport(const TransportMessage& t) { (void)t; }
  virtual void on_midi_input(const MidiInputMessage& m) { (void)m; }
};

enum class ActiveTransport : uint8_t { None, Tunnel, Lan };

const char* to_string(ActiveTransport a);

struct LinkStatus {
  ActiveTransport active{ActiveTransport::None};
  LinkQuality     quality{LinkQuality::Disconnected};
  std::string     peer_name;

  bool operator==(const LinkStatus& o) const {
    return active == o.active && quality == o.quality && peer_name == o.peer_name;
  }
  bool operator!=(const LinkStatus& o) const { return !(*this == o); }
};

class StatusObserver {
public:
  virtual ~StatusObserver() = default;
  virtual void on_status(const LinkStatus& status) = 0;
};

class DeviceEventListener {
public:
  virtual ~DeviceEventListener() = default;
  virtual void on_device_attached() = 0;
  virtual void on_device_detached() = 0;
};

class DeviceEventSource {
public:
  virtual ~DeviceEventSource() = default;
  /// Register (nullptr to unregister). One listener at a time.
  virtual void subscribe(DeviceEventListener* listener) = 0;
};

} // namespace cuelink
