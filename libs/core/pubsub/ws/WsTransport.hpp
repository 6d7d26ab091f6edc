#pragma once
#include <boost/beast/websocket/rfc6455.hpp>
#include <boost/signals2/signal.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>

enum class ConnectionState { Idle, Connecting, Open, Closing, Closed };

namespace close_code {
    inline constexpr std::uint16_t kNormal   = boost::beast::websocket::close_code::normal;
    inline constexpr std::uint16_t kAbnormal = boost::beast::websocket::close_code::abnormal;

    // Terminations without a close frame; these are the ones worth backing off for.
    inline bool isAbnormal(std::uint16_t code) { return code == kAbnormal; }
}

// Pure transport primitive for one WebSocket connection: no retry, no queuing.
// Events may fire on any thread; listeners must hop to their own executor.
class WsTransport {
public:
    using OpenSignal    = boost::signals2::signal<void()>;
    using MessageSignal = boost::signals2::signal<void(const std::string&)>;  // own the data to avoid dangling views
    using CloseSignal   = boost::signals2::signal<void(std::uint16_t)>;
    using ErrorSignal   = boost::signals2::signal<void(const std::string&)>;
    // Receives nullptr on success, AlreadyClosedError or TransportError otherwise.
    using CloseCb       = std::function<void(std::exception_ptr)>;

    WsTransport() = default;
    virtual ~WsTransport() = default;

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;

    // url must already be normalized to ws:// or wss://
    virtual void connect(const std::string& url) = 0;
    virtual void send(std::string msg) = 0;   // serialized by implementation
    virtual void close(CloseCb done) = 0;
    // Drops the connection without a close handshake. Any handle that is not yet
    // Closed, an Idle one included, reports onClose(kAbnormal) once.
    virtual void cancel() = 0;
    virtual ConnectionState state() const = 0;

    boost::signals2::connection onOpen(const OpenSignal::slot_type& cb)       { return m_open.connect(cb); }
    boost::signals2::connection onMessage(const MessageSignal::slot_type& cb) { return m_message.connect(cb); }
    boost::signals2::connection onClose(const CloseSignal::slot_type& cb)     { return m_close.connect(cb); }
    boost::signals2::connection onError(const ErrorSignal::slot_type& cb)     { return m_error.connect(cb); }

protected:
    OpenSignal    m_open;
    MessageSignal m_message;
    CloseSignal   m_close;
    ErrorSignal   m_error;
};

inline const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Idle:       return "Idle";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Open:       return "Open";
        case ConnectionState::Closing:    return "Closing";
        case ConnectionState::Closed:     return "Closed";
    }
    return "Unknown";
}
