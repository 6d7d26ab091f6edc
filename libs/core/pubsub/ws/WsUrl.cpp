#include "WsUrl.hpp"
#include <cstdlib>
#include <string_view>

std::string WsUrl::toString() const {
    const bool defaultPort = (secure && port == "443") || (!secure && port == "80");
    std::string out = secure ? "wss://" : "ws://";
    out += host;
    if (!defaultPort) {
        out += ':';
        out += port;
    }
    out += target;
    return out;
}

namespace ws_url {

std::string normalizeScheme(const std::string& url) {
    constexpr std::string_view https = "https";
    constexpr std::string_view http  = "http";
    if (url.compare(0, https.size(), https) == 0) {
        return "wss" + url.substr(https.size());
    }
    if (url.compare(0, http.size(), http) == 0) {
        return "ws" + url.substr(http.size());
    }
    return url;
}

std::optional<WsUrl> parse(const std::string& url) {
    constexpr std::string_view ws  = "ws://";
    constexpr std::string_view wss = "wss://";

    WsUrl out;
    std::size_t pos = 0;
    if (url.compare(0, wss.size(), wss) == 0) {
        out.secure = true;
        pos = wss.size();
    } else if (url.compare(0, ws.size(), ws) == 0) {
        out.secure = false;
        pos = ws.size();
    } else {
        return std::nullopt;
    }

    // host[:port] runs until the first '/' or '?'
    const std::size_t end = url.find_first_of("/?", pos);
    const std::string hostport = (end == std::string::npos) ? url.substr(pos) : url.substr(pos, end - pos);
    if (hostport.empty()) return std::nullopt;

    const std::size_t colon = hostport.find(':');
    if (colon != std::string::npos) {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
    } else {
        out.host = hostport;
        out.port = out.secure ? "443" : "80";
    }

    if (out.host.empty() || out.port.empty()) return std::nullopt;
    for (char c : out.port) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
    if (p == 0 || p > 65535) return std::nullopt;

    if (end != std::string::npos) {
        out.target = url.substr(end);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
    }
    return out;
}

} // namespace ws_url
