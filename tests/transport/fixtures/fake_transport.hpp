#pragma once
#include <exception>
#include <memory>
#include <string>
#include <vector>
#include "pubsub/codec/EnvelopeCodec.hpp"
#include "pubsub/session/SessionController.hpp"
#include "pubsub/ws/TransportErrors.hpp"
#include "pubsub/ws/WsTransport.hpp"

/// Scripted WsTransport for deterministic session tests.
/// connect() only records the URL; the test decides when the socket opens,
/// receives a frame, fails or closes by calling the fire*() helpers.
namespace fixtures {

class FakeTransport : public WsTransport {
public:
    void connect(const std::string& url) override {
        connectedUrl = url;
        ++connectCalls;
        m_state = ConnectionState::Connecting;
    }

    void send(std::string msg) override { sent.push_back(std::move(msg)); }

    void close(CloseCb done) override {
        ++closeCalls;
        if (hangOnClose) {
            pendingClose = std::move(done);
            return;
        }
        const auto st = m_state;
        if (st == ConnectionState::Open || st == ConnectionState::Connecting) {
            m_state = ConnectionState::Closed;
            m_close(close_code::kNormal);
            done(closeError);
            return;
        }
        done(std::make_exception_ptr(AlreadyClosedError()));
    }

    void cancel() override {
        ++cancelCalls;
        if (m_state == ConnectionState::Closed) return;
        m_state = ConnectionState::Closed;
        m_close(close_code::kAbnormal);
    }

    ConnectionState state() const override { return m_state; }

    // --- test controls -----------------------------------------------------

    void fireOpen() {
        m_state = ConnectionState::Open;
        m_open();
    }
    void fireMessage(const std::string& bytes) { m_message(bytes); }
    void fireClose(std::uint16_t code) {
        m_state = ConnectionState::Closed;
        m_close(code);
    }
    void fireError(const std::string& message) { m_error(message); }

    // Every frame written so far, decoded back into envelopes.
    std::vector<Envelope> sentEnvelopes() const {
        std::vector<Envelope> out;
        for (const auto& frame : sent) out.push_back(EnvelopeCodec::decode(frame));
        return out;
    }

    std::string              connectedUrl;
    std::vector<std::string> sent;
    int                      connectCalls{0};
    int                      closeCalls{0};
    int                      cancelCalls{0};

    bool                     hangOnClose{false};   // never complete close()
    std::exception_ptr       closeError;           // result of a close() on an open socket
    CloseCb                  pendingClose;

private:
    ConnectionState m_state{ConnectionState::Idle};
};

/// Hands out FakeTransports and keeps every one of them for inspection.
class FakeTransportFactory {
public:
    SessionController::TransportFactory factory() {
        return [this]() -> std::shared_ptr<WsTransport> {
            auto t = std::make_shared<FakeTransport>();
            created.push_back(t);
            return t;
        };
    }

    FakeTransport& at(std::size_t i) { return *created.at(i); }
    FakeTransport& last() { return *created.back(); }
    std::size_t count() const { return created.size(); }

    std::vector<std::shared_ptr<FakeTransport>> created;
};

} // namespace fixtures
