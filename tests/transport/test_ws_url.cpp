/*
Relay — WsUrl Tests
Role: Verify scheme normalization and endpoint parsing used before every connect
*/
#include <gtest/gtest.h>
#include "pubsub/ws/WsUrl.hpp"

// =============================================================================
// Scheme normalization
// =============================================================================

TEST(WsUrl, NormalizesHttpSchemesByPrefix) {
    EXPECT_EQ(ws_url::normalizeScheme("https://host/ws"), "wss://host/ws");
    EXPECT_EQ(ws_url::normalizeScheme("http://host:8080/ws"), "ws://host:8080/ws");
    EXPECT_EQ(ws_url::normalizeScheme("wss://host"), "wss://host");
    EXPECT_EQ(ws_url::normalizeScheme("ws://host"), "ws://host");
}

// =============================================================================
// Parsing
// =============================================================================

TEST(WsUrl, AppliesDefaultPortsAndTarget) {
    auto plain = ws_url::parse("ws://example.com");
    ASSERT_TRUE(plain);
    EXPECT_FALSE(plain->secure);
    EXPECT_EQ(plain->host, "example.com");
    EXPECT_EQ(plain->port, "80");
    EXPECT_EQ(plain->target, "/");

    auto tls = ws_url::parse("wss://example.com");
    ASSERT_TRUE(tls);
    EXPECT_TRUE(tls->secure);
    EXPECT_EQ(tls->port, "443");
}

TEST(WsUrl, KeepsExplicitPortAndTargetWithQuery) {
    auto url = ws_url::parse("wss://relay.local:9443/hub/events?token=abc");
    ASSERT_TRUE(url);
    EXPECT_EQ(url->host, "relay.local");
    EXPECT_EQ(url->port, "9443");
    EXPECT_EQ(url->target, "/hub/events?token=abc");
}

TEST(WsUrl, QueryWithoutPathGetsRootTarget) {
    auto url = ws_url::parse("ws://host?x=1");
    ASSERT_TRUE(url);
    EXPECT_EQ(url->host, "host");
    EXPECT_EQ(url->target, "/?x=1");
}

TEST(WsUrl, RejectsMalformedEndpoints) {
    EXPECT_FALSE(ws_url::parse("ftp://host"));
    EXPECT_FALSE(ws_url::parse("https://host"));    // not normalized
    EXPECT_FALSE(ws_url::parse("ws://"));
    EXPECT_FALSE(ws_url::parse("ws://:80/"));
    EXPECT_FALSE(ws_url::parse("ws://host:/"));
    EXPECT_FALSE(ws_url::parse("ws://host:abc/"));
    EXPECT_FALSE(ws_url::parse("ws://host:0/"));
    EXPECT_FALSE(ws_url::parse("ws://host:70000/"));
}

TEST(WsUrl, ToStringOmitsDefaultPort) {
    EXPECT_EQ(ws_url::parse("wss://h:443/x")->toString(), "wss://h/x");
    EXPECT_EQ(ws_url::parse("ws://h:8080")->toString(), "ws://h:8080/");
}
