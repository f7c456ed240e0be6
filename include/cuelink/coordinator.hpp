#pragma once
/**
 * @file coordinator.hpp
 * @brief Owns the Tunnel and LAN transports and decides which one is live.
 *
 * @details
 * ## Arbitration
 * | event                         | action                                             |
 * |-------------------------------|----------------------------------------------------|
 * | Tunnel → Active               | stop LAN (user reason), park it, active = Tunnel   |
 * | Tunnel drops, LAN parked      | restart LAN                                        |
 * | Tunnel drops, LAN Active      | hold Tunnel (stopped) until LAN drops              |
 * | LAN → Active, Tunnel Active   | stop LAN again (late event), keep Tunnel           |
 * | LAN → Active                  | active = LAN                                       |
 * | LAN drops                     | release a held Tunnel unless a manual hold is on   |
 * | `connect_lan(ep)`             | manual hold: Tunnel stopped while that session lasts |
 *
 * Transport events are drained in `tick()`; arbitration state lives under
 * one mutex. `send()` may be called from any thread.
 *
 * ## Threading
 * - Tests: call `poll_once()` (both transports polled, then `tick()`).
 * - Daemon: `run()` starts one worker per transport and cycles `tick()` on
 *   the caller's thread until `shutdown()`.
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "cuelink/clock.hpp"
#include "cuelink/logging.hpp"
#include "cuelink/message.hpp"
#include "cuelink/security_gate.hpp"
#include "cuelink/sinks.hpp"
#include "cuelink/transport.hpp"
#include "cuelink/transport/transport_base.hpp"

namespace cuelink {

struct CoordinatorSettings {
  uint32_t gc_interval_ms{60000};    ///< security ledger sweep
  uint32_t health_check_ms{1000};    ///< repair parked/held transports with nothing active
  uint32_t poll_interval_ms{1};      ///< worker and tick() sleep in run()
};

class Coordinator : public DeviceEventListener {
public:
  Coordinator(TransportSettings tunnel_settings,
              std::unique_ptr<transport::ISocketSource> tunnel_source,
              TransportSettings lan_settings,
              std::unique_ptr<transport::ISocketSource> lan_source,
              SecurityLimits limits,
              const Clock& clock,
              MidiSink* sink = nullptr,
              Logger log = nullptr,
              CoordinatorSettings settings = {});
  ~Coordinator() override;

  Coordinator(const Coordinator&) = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  void set_status_observer(StatusObserver* obs) { observer_ = obs; }

  // ---------- lifecycle ----------
  void start();
  void stop();
  /// Stop both transports and start them again; clears every hold.
  void force_recovery();

  /// One coordinator cycle: drain transport events, arbitrate, GC, publish status.
  void tick();
  /// Single-threaded drive for tests: poll both transports, then tick().
  void poll_once();

  /// Blocks: transport workers + tick() loop until shutdown(). Stops both on exit.
  void run();
  /// Safe from a signal handler (one atomic store).
  void shutdown() { running_.store(false); }

  // ---------- manual LAN ----------
  /// Dial `ep` on the LAN and hold the Tunnel while that session lasts.
  /// `ep.host` must be numeric (see net::resolve_host()).
  bool connect_lan(const Endpoint& ep);
  /// Drop the manual LAN session, go back to discovery and release the Tunnel.
  void disconnect_lan();

  void peer_available(TransportKind kind);

  // DeviceEventListener
  void on_device_attached() override;
  void on_device_detached() override;

  // ---------- send ----------
  /**
   * @brief Route to the active transport; with none, to whichever transport
   *        is Active (Tunnel first).
   * @return false if the message was dropped.
   */
  bool send(Message m);
  bool send_cc(int channel, int number, int value, std::string label = {}, std::string button_id = {});
  bool send_note(int channel, int number, int velocity, std::string label = {}, std::string button_id = {});
  bool send_transport(const std::string& action);
  bool send_midi_input(int status, int data1, int data2);

  // ---------- inspection ----------
  LinkStatus      status() const;
  ActiveTransport active() const;
  bool            tunnel_held() const;
  bool            lan_parked() const;
  bool            manual_lan() const;
  uint64_t        dropped_sends() const { return dropped_.load(); }

  Transport&    tunnel()   { return *tunnel_; }
  Transport&    lan()      { return *lan_; }
  SecurityGate& security() { return gate_; }

private:
  void dispatch_inbound(TransportKind kind, const Message& m);
  void on_tunnel_event(const TransportEvent& e);   // mu_ held
  void on_lan_event(const TransportEvent& e);      // mu_ held
  void release_tunnel();                           // mu_ held
  void unpark_lan();                               // mu_ held
  void health_check();                             // mu_ held
  LinkStatus compute_status() const;               // mu_ held

  void start_workers();
  void stop_workers();

  CoordinatorSettings settings_;
  const Clock&        clock_;
  Logger              log_;
  SecurityGate        gate_;
  MidiSink*           sink_;
  StatusObserver*     observer_{nullptr};

  std::unique_ptr<Transport> tunnel_;
  std::unique_ptr<Transport> lan_;

  mutable std::mutex mu_;
  ActiveTransport    active_{ActiveTransport::None};
  bool               started_{false};
  bool               lan_parked_{false};   // stopped because the Tunnel took over
  bool               tunnel_held_{false};  // stopped because the LAN is in use
  bool               manual_lan_{false};   // connect_lan() session in progress
  std::string        tunnel_peer_;
  std::string        lan_peer_;
  LinkStatus         last_status_;
  uint64_t           last_gc_ms_{0};
  uint64_t           last_health_ms_{0};

  std::atomic<uint64_t> dropped_{0};
  std::atomic<bool>     running_{false};
  std::atomic<bool>     workers_running_{false};
  std::thread           tunnel_worker_;
  std::thread           lan_worker_;
};

} // namespace cuelink
