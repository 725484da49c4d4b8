#include <gtest/gtest.h>

#include <protocol/codec.hpp>

using namespace tvremote;

TEST(CodecTest, Encode_WritesMethodAndParams) {
    codec::Envelope envelope;
    envelope.method = "ms.remote.control";
    envelope.params["Cmd"] = "Click";

    auto j = nlohmann::json::parse(codec::encode(envelope));
    EXPECT_EQ(j["method"], "ms.remote.control");
    EXPECT_EQ(j["params"]["Cmd"], "Click");
}

TEST(CodecTest, Encode_NullParamsBecomeEmptyObject) {
    codec::Envelope envelope;
    envelope.method = "ms.remote.control";
    envelope.params = nullptr;

    auto decoded = codec::decode_envelope(codec::encode(envelope));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->params.is_object());
    EXPECT_TRUE(decoded->params.empty());
}

TEST(CodecTest, DecodeEnvelope_RejectsMissingOrWrongTypedFields) {
    EXPECT_FALSE(codec::decode_envelope(R"({"params": {}})").has_value());
    EXPECT_FALSE(codec::decode_envelope(R"({"method": "", "params": {}})").has_value());
    EXPECT_FALSE(codec::decode_envelope(R"({"method": 7, "params": {}})").has_value());
    EXPECT_FALSE(codec::decode_envelope(R"({"method": "m"})").has_value());
    EXPECT_FALSE(codec::decode_envelope(R"({"method": "m", "params": []})").has_value());
}

TEST(CodecTest, DecodeEvent_KeepsData) {
    auto event = codec::decode_event(
        R"({"event": "ms.channel.connect", "data": {"token": "abc123", "clients": []}})");

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->event, "ms.channel.connect");
    ASSERT_TRUE(event->data.is_object());
    EXPECT_EQ(event->data["token"], "abc123");
}

TEST(CodecTest, DecodeEvent_MissingDataIsNull) {
    auto event = codec::decode_event(R"({"event": "ms.channel.unauthorized"})");

    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(event->data.is_null());
}

TEST(CodecTest, DecodeEvent_RejectsMalformedFrames) {
    EXPECT_FALSE(codec::decode_event("").has_value());
    EXPECT_FALSE(codec::decode_event("not json").has_value());
    EXPECT_FALSE(codec::decode_event(R"({"event": "ms.channel.connect")").has_value());
    EXPECT_FALSE(codec::decode_event(R"(["ms.channel.connect"])").has_value());
    EXPECT_FALSE(codec::decode_event(R"({"data": {}})").has_value());
    EXPECT_FALSE(codec::decode_event(R"({"event": ""})").has_value());
    EXPECT_FALSE(codec::decode_event(R"({"event": 42})").has_value());
}
