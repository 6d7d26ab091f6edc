/*
Relay — SessionConfig
Role: Loads session tunables from a JSON file and applies environment overrides.
Inputs/Outputs: Reads e.g. 'relay.json'; produces a SessionConfig value.
Threading: All methods execute on the calling thread.
Observability: Logs the loaded file and each environment override on relay.app.
Assumptions: Durations in the file are integers (milliseconds or seconds as named).
*/
#include "SessionConfig.hpp"
#include "RelayLogging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace {

template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("SessionConfig: invalid value for '") + key + "': " + e.what());
    }
}

template <typename Duration>
void readDuration(const nlohmann::json& j, const char* key, Duration& out) {
    typename Duration::rep count = out.count();
    readKey(j, key, count);
    if (count < 0) {
        throw std::runtime_error(std::string("SessionConfig: '") + key + "' must not be negative");
    }
    out = Duration{count};
}

bool envInteger(const char* name, long long& out) {
    const char* env = std::getenv(name);
    if (!env || !*env) return false;
    char* end = nullptr;
    const long long v = std::strtoll(env, &end, 10);
    if (*end != '\0' || v < 0) {
        rLog_Warning("Ignoring malformed environment override" << name << "=" << env);
        return false;
    }
    out = v;
    return true;
}

} // namespace

SessionConfig SessionConfig::fromJsonText(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const std::exception& ex) {
        throw std::runtime_error("SessionConfig: failed to parse JSON: " + std::string(ex.what()));
    }
    if (!j.is_object()) {
        throw std::runtime_error("SessionConfig: top-level JSON value must be an object");
    }

    SessionConfig cfg;
    readDuration(j, "reconnect_delay_ms", cfg.reconnectDelay);
    readDuration(j, "close_timeout_ms", cfg.closeTimeout);
    readDuration(j, "connect_timeout_s", cfg.connectTimeout);
    readDuration(j, "ping_interval_s", cfg.pingInterval);
    readKey(j, "verify_peer", cfg.verifyPeer);
    readKey(j, "url", cfg.url);
    readKey(j, "topics", cfg.topics);
    return cfg;
}

SessionConfig SessionConfig::fromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("SessionConfig: failed to open config file: " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    SessionConfig cfg = fromJsonText(text);
    rLog_App("Loaded session config from" << QString::fromStdString(path));
    return cfg;
}

void SessionConfig::applyEnvironment() {
    if (const char* url = std::getenv("RELAY_URL"); url && *url) {
        this->url = url;
        rLog_App("RELAY_URL override:" << url);
    }
    long long v = 0;
    if (envInteger("RELAY_RECONNECT_DELAY_MS", v)) reconnectDelay = std::chrono::milliseconds{v};
    if (envInteger("RELAY_CLOSE_TIMEOUT_MS", v))   closeTimeout   = std::chrono::milliseconds{v};
    if (envInteger("RELAY_PING_INTERVAL_S", v))    pingInterval   = std::chrono::seconds{v};
    if (const char* verify = std::getenv("RELAY_VERIFY_PEER"); verify && *verify) {
        const std::string s(verify);
        verifyPeer = !(s == "0" || s == "false" || s == "off");
        if (!verifyPeer) rLog_Warning("TLS peer verification disabled via RELAY_VERIFY_PEER");
    }
}
