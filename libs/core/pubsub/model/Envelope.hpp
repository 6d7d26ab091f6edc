#pragma once
#include <string>
#include <utility>

// Well-known envelope types; any other string is passed through untouched.
namespace envelope_type {
    inline constexpr const char* kSubscribe = "sub";
    inline constexpr const char* kAck       = "ack";
    inline constexpr const char* kData      = "data";
}

// Topic-addressed message unit exchanged over the transport.
// Value type: the session copies it into the queue and never mutates it afterwards.
struct Envelope {
    std::string topic;
    std::string type;
    std::string payload;   // opaque, typically JSON text
    bool        silent{false};

    static Envelope subscribe(std::string topic) {
        return Envelope{std::move(topic), envelope_type::kSubscribe, "", true};
    }
    static Envelope ack(std::string topic) {
        return Envelope{std::move(topic), envelope_type::kAck, "", true};
    }
    static Envelope data(std::string topic, std::string payload) {
        return Envelope{std::move(topic), envelope_type::kData, std::move(payload), false};
    }

    [[nodiscard]] bool isSubscribe() const { return type == envelope_type::kSubscribe; }

    friend bool operator==(const Envelope&, const Envelope&) = default;
};
