#pragma once
#include <stdexcept>
#include <string>

// Error taxonomy of the pub/sub transport. Everything derives from TransportError
// so callers can catch the whole family from a future::get().
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Underlying resolve/connect/handshake failed.
class ConnectError : public TransportError {
public:
    using TransportError::TransportError;
};

// Inbound frame is not a well-formed envelope.
class DecodeError : public TransportError {
public:
    using TransportError::TransportError;
};

// close() requested on a connection that is not open.
class AlreadyClosedError : public TransportError {
public:
    AlreadyClosedError() : TransportError(kNotConnected) {}
    using TransportError::TransportError;

    static constexpr const char* kNotConnected = "WebSocket is not connected";
};

// Pending open() released without an established connection (close/dispose won the race).
class SessionAbortedError : public TransportError {
public:
    using TransportError::TransportError;
};
