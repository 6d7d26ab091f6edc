/*
Relay — TopicEventRouter Tests
Role: Verify topic-keyed fan-out and typed payload binding
Coverage: Raw and typed handlers, unbinding, conversion failures isolated per handler
*/
#include <gtest/gtest.h>
#include "pubsub/dispatch/TopicEventRouter.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace {

struct Quote {
    std::string symbol;
    double      price{0.0};
};

void from_json(const nlohmann::json& j, Quote& q) {
    j.at("symbol").get_to(q.symbol);
    j.at("price").get_to(q.price);
}

} // namespace

// =============================================================================
// Raw handlers
// =============================================================================

TEST(TopicEventRouter, DispatchesOnlyToMatchingTopic) {
    TopicEventRouter router;
    int a = 0, b = 0;
    router.listen("a", [&](const Envelope&) { ++a; });
    router.listen("b", [&](const Envelope&) { ++b; });

    router.dispatch(Envelope::data("a", "{}"));
    router.dispatch(Envelope::data("a", "{}"));
    router.dispatch(Envelope::data("unbound", "{}"));

    EXPECT_EQ(a, 2);
    EXPECT_EQ(b, 0);
}

TEST(TopicEventRouter, HandlersRunInRegistrationOrder) {
    TopicEventRouter router;
    std::vector<int> calls;
    router.listen("t", [&](const Envelope&) { calls.push_back(1); });
    router.listen("t", [&](const Envelope&) { calls.push_back(2); });

    router.dispatch(Envelope::data("t", ""));

    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
    EXPECT_EQ(router.handlerCount("t"), 2u);
}

TEST(TopicEventRouter, UnsubscribeTopicDropsAllBindings) {
    TopicEventRouter router;
    int hits = 0;
    router.listen("t", [&](const Envelope&) { ++hits; });
    router.listen("t", [&](const Envelope&) { ++hits; });

    router.unsubscribeTopic("t");
    router.dispatch(Envelope::data("t", ""));

    EXPECT_EQ(hits, 0);
    EXPECT_EQ(router.handlerCount("t"), 0u);
    EXPECT_TRUE(router.topics().empty());
}

TEST(TopicEventRouter, ThrowingHandlerDoesNotStopTheOthers) {
    TopicEventRouter router;
    int after = 0;
    router.listen("t", [](const Envelope&) { throw std::runtime_error("handler bug"); });
    router.listen("t", [&](const Envelope&) { ++after; });

    EXPECT_NO_THROW(router.dispatch(Envelope::data("t", "")));
    EXPECT_EQ(after, 1);
}

// =============================================================================
// Typed handlers
// =============================================================================

TEST(TopicEventRouter, TypedHandlerReceivesDecodedPayload) {
    TopicEventRouter router;
    std::vector<Quote> quotes;
    router.listenFor<Quote>("quotes", [&](const TopicEvent<Quote>& ev) {
        EXPECT_EQ(ev.topic, "quotes");
        EXPECT_EQ(ev.envelope.type, "data");
        quotes.push_back(ev.payload);
    });

    router.dispatch(Envelope::data("quotes", R"({"symbol":"BTC-USD","price":101.5})"));

    ASSERT_EQ(quotes.size(), 1u);
    EXPECT_EQ(quotes[0].symbol, "BTC-USD");
    EXPECT_DOUBLE_EQ(quotes[0].price, 101.5);
}

TEST(TopicEventRouter, StringHandlerReceivesPayloadVerbatim) {
    TopicEventRouter router;
    std::string seen;
    router.listenFor<std::string>("raw", [&](const TopicEvent<std::string>& ev) { seen = ev.payload; });

    router.dispatch(Envelope::data("raw", "not json at all"));

    EXPECT_EQ(seen, "not json at all");
}

TEST(TopicEventRouter, ConversionFailureSkipsOnlyThatHandler) {
    TopicEventRouter router;
    int typed = 0, raw = 0;
    router.listenFor<Quote>("quotes", [&](const TopicEvent<Quote>&) { ++typed; });
    router.listen("quotes", [&](const Envelope&) { ++raw; });

    EXPECT_NO_THROW(router.dispatch(Envelope::data("quotes", R"({"symbol":"BTC-USD"})")));
    EXPECT_NO_THROW(router.dispatch(Envelope::data("quotes", "garbage")));

    EXPECT_EQ(typed, 0);
    EXPECT_EQ(raw, 2);
}
