/*
Relay — SessionConfig Tests
Role: Verify JSON loading rules and environment overrides
Testing Strategy: JSON text / env vars in → assert fields or std::runtime_error
*/
#include <gtest/gtest.h>
#include "pubsub/session/SessionConfig.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace std::chrono_literals;

namespace {

// Clears the overrides touched by these tests so they do not leak between cases
class SessionConfigEnv : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"RELAY_URL", "RELAY_RECONNECT_DELAY_MS", "RELAY_CLOSE_TIMEOUT_MS",
                                 "RELAY_PING_INTERVAL_S", "RELAY_VERIFY_PEER"}) {
            ::unsetenv(name);
        }
    }
};

} // namespace

// =============================================================================
// JSON
// =============================================================================

TEST(SessionConfig, DefaultsMatchDocumentedValues) {
    SessionConfig cfg;
    EXPECT_EQ(cfg.reconnectDelay, 2000ms);
    EXPECT_EQ(cfg.closeTimeout, 5000ms);
    EXPECT_EQ(cfg.connectTimeout, 30s);
    EXPECT_EQ(cfg.pingInterval, 25s);
    EXPECT_TRUE(cfg.verifyPeer);
    EXPECT_TRUE(cfg.url.empty());
    EXPECT_TRUE(cfg.topics.empty());
}

TEST(SessionConfig, MissingKeysKeepDefaults) {
    auto cfg = SessionConfig::fromJsonText(R"({"reconnect_delay_ms": 250})");
    EXPECT_EQ(cfg.reconnectDelay, 250ms);
    EXPECT_EQ(cfg.closeTimeout, 5000ms);
}

TEST(SessionConfig, ReadsEveryKey) {
    auto cfg = SessionConfig::fromJsonText(R"({
        "reconnect_delay_ms": 100,
        "close_timeout_ms": 700,
        "connect_timeout_s": 5,
        "ping_interval_s": 0,
        "verify_peer": false,
        "url": "https://relay.example/ws",
        "topics": ["a", "b"]
    })");

    EXPECT_EQ(cfg.reconnectDelay, 100ms);
    EXPECT_EQ(cfg.closeTimeout, 700ms);
    EXPECT_EQ(cfg.connectTimeout, 5s);
    EXPECT_EQ(cfg.pingInterval, 0s);
    EXPECT_FALSE(cfg.verifyPeer);
    EXPECT_EQ(cfg.url, "https://relay.example/ws");
    EXPECT_EQ(cfg.topics, (std::vector<std::string>{"a", "b"}));
}

TEST(SessionConfig, WrongTypesAndNegativeDurationsThrow) {
    EXPECT_THROW(SessionConfig::fromJsonText(R"({"reconnect_delay_ms": "fast"})"), std::runtime_error);
    EXPECT_THROW(SessionConfig::fromJsonText(R"({"topics": "a"})"), std::runtime_error);
    EXPECT_THROW(SessionConfig::fromJsonText(R"({"close_timeout_ms": -1})"), std::runtime_error);
    EXPECT_THROW(SessionConfig::fromJsonText("[]"), std::runtime_error);
    EXPECT_THROW(SessionConfig::fromJsonText("{"), std::runtime_error);
}

TEST(SessionConfig, ErrorNamesTheOffendingKey) {
    try {
        SessionConfig::fromJsonText(R"({"verify_peer": "nope"})");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("verify_peer"), std::string::npos);
    }
}

TEST(SessionConfig, FromFileReadsAndReportsMissingFiles) {
    const std::string path = ::testing::TempDir() + "relay_session_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"url": "ws://localhost:9000/", "close_timeout_ms": 1500})";
    }
    auto cfg = SessionConfig::fromFile(path);
    EXPECT_EQ(cfg.url, "ws://localhost:9000/");
    EXPECT_EQ(cfg.closeTimeout, 1500ms);
    std::remove(path.c_str());

    EXPECT_THROW(SessionConfig::fromFile(path), std::runtime_error);
}

// =============================================================================
// Environment
// =============================================================================

TEST_F(SessionConfigEnv, OverridesApplyOnTopOfFileValues) {
    ::setenv("RELAY_URL", "wss://override/", 1);
    ::setenv("RELAY_RECONNECT_DELAY_MS", "42", 1);
    ::setenv("RELAY_CLOSE_TIMEOUT_MS", "99", 1);
    ::setenv("RELAY_PING_INTERVAL_S", "3", 1);
    ::setenv("RELAY_VERIFY_PEER", "off", 1);

    auto cfg = SessionConfig::fromJsonText(R"({"url": "ws://from-file/"})");
    cfg.applyEnvironment();

    EXPECT_EQ(cfg.url, "wss://override/");
    EXPECT_EQ(cfg.reconnectDelay, 42ms);
    EXPECT_EQ(cfg.closeTimeout, 99ms);
    EXPECT_EQ(cfg.pingInterval, 3s);
    EXPECT_FALSE(cfg.verifyPeer);
}

TEST_F(SessionConfigEnv, MalformedOverridesAreIgnored) {
    ::setenv("RELAY_RECONNECT_DELAY_MS", "soon", 1);
    ::setenv("RELAY_CLOSE_TIMEOUT_MS", "-5", 1);

    SessionConfig cfg;
    cfg.applyEnvironment();

    EXPECT_EQ(cfg.reconnectDelay, 2000ms);
    EXPECT_EQ(cfg.closeTimeout, 5000ms);
}
