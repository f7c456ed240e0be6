#pragma once
// tests/fakes.hpp — in-memory stream and socket source for driving Transport.

#include <algorithm>
#include <cstring>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cuelink/transport/transport_base.hpp"

namespace cuelink::test {

// Shared between the test and the FakeStream the Transport owns.
struct Pipe {
    std::string inbound;          // bytes the Transport will read
    std::string outbound;         // bytes the Transport wrote
    bool busy{false};             // send() returns Busy
    bool peer_closed{false};      // recv() returns Closed once inbound is drained
    bool rx_error{false};
    bool closed_by_owner{false};  // Transport called close()

    // Pop complete lines written by the Transport.
    std::vector<std::string> take_lines() {
        std::vector<std::string> out;
        size_t pos = 0;
        for (;;) {
            const size_t nl = outbound.find('\n', pos);
            if (nl == std::string::npos) break;
            out.push_back(outbound.substr(pos, nl - pos));
            pos = nl + 1;
        }
        outbound.erase(0, pos);
        return out;
    }
};

class FakeStream : public transport::IStream {
public:
    FakeStream(std::shared_ptr<Pipe> pipe, Endpoint peer)
    : pipe_(std::move(pipe)), peer_(std::move(peer)) {}

    transport::RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
        out_len = 0;
        if (pipe_->rx_error) return transport::RxResult::Error;
        if (pipe_->inbound.empty())
            return pipe_->peer_closed ? transport::RxResult::Closed : transport::RxResult::None;
        out_len = std::min(cap, pipe_->inbound.size());
        std::memcpy(out, pipe_->inbound.data(), out_len);
        pipe_->inbound.erase(0, out_len);
        return transport::RxResult::Ok;
    }

    transport::TxResult send(const uint8_t* data, std::size_t len, std::size_t& written) override {
        written = 0;
        if (pipe_->busy) return transport::TxResult::Busy;
        pipe_->outbound.append(reinterpret_cast<const char*>(data), len);
        written = len;
        return transport::TxResult::Ok;
    }

    void close() override { pipe_->closed_by_owner = true; }
    const Endpoint& peer() const override { return peer_; }

private:
    std::shared_ptr<Pipe> pipe_;
    Endpoint              peer_;
};

// Hands out queued streams whenever the Transport may connect.
class FakeSource : public transport::ISocketSource {
public:
    FakeSource(Role role, TransportKind kind) : role_(role), kind_(kind) {}

    Role          role() const override { return role_; }
    TransportKind kind() const override { return kind_; }
    LinkState     waiting_state() const override {
        return role_ == Role::Responder ? LinkState::Listening : LinkState::Discovering;
    }
    const char*   name() const override { return "fake"; }

    transport::SourceEvent poll(uint64_t, bool may_connect) override {
        ++polls;
        last_may_connect = may_connect;
        if (!may_connect || pending_.empty()) return transport::SourceEvent::none();
        auto ev = std::move(pending_.front());
        pending_.pop_front();
        return ev;
    }

    void close() override { ++closes; }

    bool take_peer_appeared() override {
        const bool v = appeared;
        appeared = false;
        return v;
    }

    bool retarget(const std::optional<Endpoint>& ep) override {
        target = ep;
        ++retargets;
        return role_ == Role::Initiator;
    }

    // Queue a connected stream; returns the pipe the test drives.
    std::shared_ptr<Pipe> connect(const std::string& host = "10.0.0.7", uint16_t port = 50000) {
        auto pipe = std::make_shared<Pipe>();
        Endpoint peer{kind_, host, port, {}};
        pending_.push_back(transport::SourceEvent::connected(std::make_unique<FakeStream>(pipe, peer)));
        return pipe;
    }

    void fail(TransportError err) {
        pending_.push_back(transport::SourceEvent::failed(err));
    }

    int  polls{0};
    int  closes{0};
    int  retargets{0};
    bool last_may_connect{false};
    bool appeared{false};
    std::optional<Endpoint> target;

private:
    Role                               role_;
    TransportKind                      kind_;
    std::deque<transport::SourceEvent> pending_;
};

} // namespace cuelink::test
