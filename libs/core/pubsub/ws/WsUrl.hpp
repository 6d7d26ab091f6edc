#pragma once
#include <optional>
#include <string>

// Components of a ws:// or wss:// endpoint.
struct WsUrl {
    bool        secure{false};
    std::string host;
    std::string port;
    std::string target{"/"};

    [[nodiscard]] std::string toString() const;

    friend bool operator==(const WsUrl&, const WsUrl&) = default;
};

namespace ws_url {

// http:// → ws://, https:// → wss://; anything else is returned unchanged.
std::string normalizeScheme(const std::string& url);

// Parses a ws:// or wss:// URL (after normalizeScheme). Default ports are
// 80/443 and the default target is "/". Returns nullopt on malformed input.
std::optional<WsUrl> parse(const std::string& url);

} // namespace ws_url
