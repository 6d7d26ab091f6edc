#pragma once
#include <chrono>
#include <string>
#include <vector>

// Tunables for a pub/sub session and the sockets it creates.
struct SessionConfig {
    std::chrono::milliseconds reconnectDelay{2000};   // backoff after an abnormal close
    std::chrono::milliseconds closeTimeout{5000};     // upper bound for a graceful close
    std::chrono::seconds      connectTimeout{30};     // resolve + TCP + TLS + WS handshake
    std::chrono::seconds      pingInterval{25};       // 0 disables keep-alive pings
    bool                      verifyPeer{true};       // TLS certificate verification for wss://

    std::string               url;                    // optional default target
    std::vector<std::string>  topics;                 // optional initial subscriptions

    // Reads a JSON object; absent keys keep their defaults, wrongly typed keys throw.
    static SessionConfig fromFile(const std::string& path);
    static SessionConfig fromJsonText(const std::string& text);

    // RELAY_URL, RELAY_RECONNECT_DELAY_MS, RELAY_CLOSE_TIMEOUT_MS,
    // RELAY_PING_INTERVAL_S, RELAY_VERIFY_PEER
    void applyEnvironment();
};
