#pragma once
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>
#include "../model/Envelope.hpp"

// Typed view of an inbound envelope; T is decoded from the payload JSON.
template <typename T>
struct TopicEvent {
    std::string topic;
    T           payload;
    Envelope    envelope;
};

// Topic-keyed event dispatch facility the session binds typed subscriptions to.
class TopicDispatcher {
public:
    using RawHandler = std::function<void(const Envelope&)>;

    virtual ~TopicDispatcher() = default;

    virtual void listen(const std::string& topic, RawHandler handler) = 0;
    // Drops every handler bound to the topic.
    virtual void unsubscribeTopic(const std::string& topic) = 0;
    virtual void dispatch(const Envelope& envelope) = 0;

    // T needs an nlohmann from_json; std::string receives the payload verbatim.
    // Conversion failures throw out of the handler and are reported by dispatch().
    template <typename T>
    void listenFor(const std::string& topic, std::function<void(const TopicEvent<T>&)> callback) {
        listen(topic, [cb = std::move(callback)](const Envelope& e) {
            if constexpr (std::is_same_v<T, std::string>) {
                cb(TopicEvent<T>{e.topic, e.payload, e});
            } else {
                T value = nlohmann::json::parse(e.payload).template get<T>();
                cb(TopicEvent<T>{e.topic, std::move(value), e});
            }
        });
    }
};
