/*
Relay — EnvelopeCodec Tests
Role: Verify the JSON wire form of envelopes and the rejection rules on decode
Testing Strategy: Golden frames in → assert decoded fields or DecodeError
Coverage: Encode shape, defaults, inlined payloads, malformed frames
*/
#include <gtest/gtest.h>
#include "pubsub/codec/EnvelopeCodec.hpp"
#include "pubsub/ws/TransportErrors.hpp"
#include "fixtures/envelopes.hpp"
#include <nlohmann/json.hpp>

// =============================================================================
// Encode
// =============================================================================

TEST(EnvelopeCodec, EncodesAllFourFields) {
    auto json = nlohmann::json::parse(EnvelopeCodec::encode(Envelope::data("prices", R"({"p":1})")));

    EXPECT_EQ(json["topic"], "prices");
    EXPECT_EQ(json["type"], "data");
    EXPECT_EQ(json["payload"], R"({"p":1})");
    EXPECT_EQ(json["silent"], false);
    EXPECT_EQ(json.size(), 4u);
}

TEST(EnvelopeCodec, SubscribeAndAckAreSilentWithEmptyPayload) {
    for (const auto& e : {Envelope::subscribe("t"), Envelope::ack("t")}) {
        auto json = nlohmann::json::parse(EnvelopeCodec::encode(e));
        EXPECT_EQ(json["payload"], "");
        EXPECT_EQ(json["silent"], true);
    }
    EXPECT_EQ(nlohmann::json::parse(EnvelopeCodec::encode(Envelope::subscribe("t")))["type"], "sub");
    EXPECT_EQ(nlohmann::json::parse(EnvelopeCodec::encode(Envelope::ack("t")))["type"], "ack");
}

TEST(EnvelopeCodec, InvalidUtf8IsReplacedInsteadOfThrowing) {
    std::string frame;
    EXPECT_NO_THROW(frame = EnvelopeCodec::encode(Envelope::data("bin\xff", "\xff\xfe raw")));

    auto e = EnvelopeCodec::decode(frame);
    EXPECT_EQ(e.topic, "bin\xEF\xBF\xBD");
    EXPECT_EQ(e.payload, "\xEF\xBF\xBD\xEF\xBF\xBD raw");
}

// =============================================================================
// Decode
// =============================================================================

TEST(EnvelopeCodec, DecodesPeerFrame) {
    auto e = EnvelopeCodec::decode(fixtures::wireEnvelope("chat", "data", "hello", true));

    EXPECT_EQ(e.topic, "chat");
    EXPECT_EQ(e.type, "data");
    EXPECT_EQ(e.payload, "hello");
    EXPECT_TRUE(e.silent);
}

TEST(EnvelopeCodec, MissingPayloadAndSilentTakeDefaults) {
    auto e = EnvelopeCodec::decode(R"({"topic":"a","type":"custom"})");

    EXPECT_EQ(e.type, "custom");
    EXPECT_EQ(e.payload, "");
    EXPECT_FALSE(e.silent);
}

TEST(EnvelopeCodec, NullPayloadBecomesEmpty) {
    EXPECT_EQ(EnvelopeCodec::decode(R"({"topic":"a","type":"data","payload":null})").payload, "");
}

TEST(EnvelopeCodec, InlinedPayloadIsKeptAsCompactJson) {
    auto e = EnvelopeCodec::decode(R"({"topic":"a","type":"data","payload":{"x": [1, 2]}})");
    EXPECT_EQ(e.payload, R"({"x":[1,2]})");

    EXPECT_EQ(EnvelopeCodec::decode(R"({"topic":"a","type":"data","payload":42})").payload, "42");
}

TEST(EnvelopeCodec, RejectsInvalidJson) {
    EXPECT_THROW(EnvelopeCodec::decode("not json"), DecodeError);
    EXPECT_THROW(EnvelopeCodec::decode(""), DecodeError);
}

TEST(EnvelopeCodec, RejectsNonObjects) {
    EXPECT_THROW(EnvelopeCodec::decode("[1,2,3]"), DecodeError);
    EXPECT_THROW(EnvelopeCodec::decode("\"text\""), DecodeError);
}

TEST(EnvelopeCodec, RejectsMissingOrMistypedTopicAndType) {
    EXPECT_THROW(EnvelopeCodec::decode(R"({"type":"data"})"), DecodeError);
    EXPECT_THROW(EnvelopeCodec::decode(R"({"topic":"a"})"), DecodeError);
    EXPECT_THROW(EnvelopeCodec::decode(R"({"topic":1,"type":"data"})"), DecodeError);
    EXPECT_THROW(EnvelopeCodec::decode(R"({"topic":"a","type":false})"), DecodeError);
}

TEST(EnvelopeCodec, RejectsNonBooleanSilent) {
    EXPECT_THROW(EnvelopeCodec::decode(R"({"topic":"a","type":"data","silent":"yes"})"), DecodeError);
    EXPECT_THROW(EnvelopeCodec::decode(R"({"topic":"a","type":"data","silent":1})"), DecodeError);
}

TEST(EnvelopeCodec, DecodeErrorIsATransportError) {
    try {
        EnvelopeCodec::decode("{");
        FAIL() << "expected DecodeError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("JSON"), std::string::npos);
    }
}
