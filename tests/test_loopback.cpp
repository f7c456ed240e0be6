#include <doctest/doctest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "cuelink/clock.hpp"
#include "cuelink/security_gate.hpp"
#include "cuelink/transport.hpp"
#include "cuelink/transport/dialer_source.hpp"
#include "cuelink/transport/discovery.hpp"
#include "cuelink/transport/listener_source.hpp"
#include "cuelink/transport/tcp_stream.hpp"

using namespace cuelink;
using namespace cuelink::transport;

template <typename Pred>
static bool spin(Transport& a, Transport& b, Pred done, int rounds = 600) {
    for (int i = 0; i < rounds; ++i) {
        a.poll();
        b.poll();
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

TEST_CASE("Real sockets on 127.0.0.1: handshake, then a CC crosses the link") {
    SteadyClock clock;
    SecurityGate gate;

    ListenerConfig lc;
    lc.bind_host = "127.0.0.1";
    lc.port      = 0;
    auto listener_src = std::make_unique<TcpListenerSource>(TransportKind::Tunnel, lc);
    auto* listener_raw = listener_src.get();

    TransportSettings responder_settings;
    Transport responder(responder_settings, std::move(listener_src), clock, gate);
    std::vector<Message> received;
    responder.set_inbound_handler([&](TransportKind, const Message& m) { received.push_back(m); });
    responder.start();
    responder.poll();
    REQUIRE(listener_raw->is_listening());
    const uint16_t port = listener_raw->bound_port();
    REQUIRE(port != 0);

    auto provider = std::make_shared<StaticEndpoint>(Endpoint{TransportKind::Tunnel, "127.0.0.1", port, "loop"});
    TransportSettings initiator_settings;
    initiator_settings.local_name = "Cue Bear";
    Transport initiator(initiator_settings, std::make_unique<TcpDialerSource>(TransportKind::Tunnel, provider),
                        clock, gate);
    initiator.start();

    REQUIRE(spin(responder, initiator, [&] { return responder.is_active() && initiator.is_active(); }));
    CHECK(responder.connection()->peer_name == "Cue Bear");
    CHECK(initiator.connection()->protocol_major == 2);

    auto cc = make_cc(1, 74, 100);
    REQUIRE(cc.has_value());
    REQUIRE(initiator.send(Message{*cc}));
    REQUIRE(spin(responder, initiator, [&] { return !received.empty(); }));
    CHECK(std::get<CcMessage>(received[0]).number == 74);
    CHECK(std::get<CcMessage>(received[0]).value == 100);

    initiator.stop();
    CHECK(spin(responder, initiator, [&] { return !responder.is_active(); }));
}

TEST_CASE("Dialer refuses host names instead of looking them up") {
    auto provider = std::make_shared<StaticEndpoint>(Endpoint{TransportKind::Lan, "studio.invalid", 9361, "Studio"});
    TcpDialerSource dialer(TransportKind::Lan, provider);

    const auto started = std::chrono::steady_clock::now();
    auto ev = dialer.poll(0, true);
    const auto waited = std::chrono::steady_clock::now() - started;

    CHECK(ev.kind == SourceEvent::Kind::Failed);
    CHECK(ev.error == TransportError::ConnectFailed);
    CHECK(ev.endpoint.host == "studio.invalid");
    CHECK_FALSE(dialer.dialing());
    CHECK(waited < std::chrono::milliseconds(100));
}

TEST_CASE("Startup resolution turns names into numeric hosts") {
    std::string numeric, err;
    REQUIRE(net::resolve_host("127.0.0.1", numeric, err));
    CHECK(numeric == "127.0.0.1");

    REQUIRE(net::resolve_host("localhost", numeric, err));
    CHECK((numeric == "127.0.0.1" || numeric == "::1"));

    CHECK_FALSE(net::resolve_host("", numeric, err));
    CHECK_FALSE(err.empty());
}
