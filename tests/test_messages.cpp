#include <gtest/gtest.h>
#include "messages.h"
#include <nlohmann/json.hpp>
#include <vector>

using namespace skyshare;

class MessagesTest : public ::testing::Test {
protected:
    // encode(decode(bytes)) must give back the very same bytes
    void expect_stable_encoding(const Payload& payload) {
        std::vector<uint8_t> bytes = encode_payload(payload);
        DecodeResult decoded = decode_payload(bytes);
        ASSERT_TRUE(decoded.success) << payload_type_name(payload) << ": " << decoded.error_message;
        EXPECT_TRUE(decoded.payload == payload) << payload_type_name(payload);
        EXPECT_EQ(encode_payload(decoded.payload), bytes) << payload_type_name(payload);
    }

    std::vector<uint8_t> to_msgpack(const nlohmann::json& json) {
        return nlohmann::json::to_msgpack(json);
    }
};

TEST_F(MessagesTest, EveryVariantEncodesStably) {
    expect_stable_encoding(payloads::Handshake{"ABC123"});
    expect_stable_encoding(payloads::InitHandshake{"pilot", "2.6.3"});
    expect_stable_encoding(payloads::AttemptConnection{SocketAddress("203.0.113.7", 40123)});
    expect_stable_encoding(payloads::AttemptConnection{SocketAddress("2001:db8::5", 7340)});
    expect_stable_encoding(payloads::PeerEstablished{});
    expect_stable_encoding(payloads::InvalidVersion{"2.6.3"});
    expect_stable_encoding(payloads::InvalidName{});
    expect_stable_encoding(payloads::RequestHosting{});
    expect_stable_encoding(payloads::HostingReceived{"XK4P9Q"});
    expect_stable_encoding(payloads::PlayerJoined{"copilot", true, false, true});
    expect_stable_encoding(payloads::PlayerLeft{"copilot"});
    expect_stable_encoding(payloads::Update{{1, 2, 3, 255}, "pilot", false, 1700000000.25});
    expect_stable_encoding(payloads::TransferControl{"pilot", "copilot"});
    expect_stable_encoding(payloads::SetObserver{"pilot", "copilot", true});
    expect_stable_encoding(payloads::SetHost{});
    expect_stable_encoding(payloads::AircraftDefinition{{'{', '}'}});
    expect_stable_encoding(payloads::Ready{});
    expect_stable_encoding(payloads::Heartbeat{});
}

TEST_F(MessagesTest, EdgeCasesEncodeStably) {
    // Empty session id confirms a direct connection
    expect_stable_encoding(payloads::Handshake{""});
    expect_stable_encoding(payloads::InitHandshake{"", ""});
    expect_stable_encoding(payloads::PlayerLeft{""});
    expect_stable_encoding(payloads::AircraftDefinition{{}});
    expect_stable_encoding(payloads::Update{{}, "", true, 0.0});
    expect_stable_encoding(payloads::Update{std::vector<uint8_t>(4000, 0x7F), "pilot", true, 0.0});
}

TEST_F(MessagesTest, EncodingIsSelfDescribing) {
    std::vector<uint8_t> bytes = encode_payload(payloads::TransferControl{"a", "b"});
    nlohmann::json json = nlohmann::json::from_msgpack(bytes);

    EXPECT_EQ(json["type"], "TransferControl");
    EXPECT_EQ(json["from"], "a");
    EXPECT_EQ(json["to"], "b");
}

TEST_F(MessagesTest, UnknownKeysAreIgnored) {
    nlohmann::json json;
    json["type"] = "PlayerLeft";
    json["name"] = "copilot";
    json["reason"] = "timeout";

    DecodeResult decoded = decode_payload(to_msgpack(json));
    ASSERT_TRUE(decoded.success) << decoded.error_message;
    ASSERT_TRUE(std::holds_alternative<payloads::PlayerLeft>(decoded.payload));
    EXPECT_EQ(std::get<payloads::PlayerLeft>(decoded.payload).name, "copilot");
}

TEST_F(MessagesTest, UnknownTypeIsRejected) {
    nlohmann::json json;
    json["type"] = "Teleport";

    DecodeResult decoded = decode_payload(to_msgpack(json));
    EXPECT_FALSE(decoded.success);
    EXPECT_FALSE(decoded.error_message.empty());
}

TEST_F(MessagesTest, MissingOrMistypedFieldsAreRejected) {
    nlohmann::json missing;
    missing["type"] = "TransferControl";
    missing["from"] = "a";
    EXPECT_FALSE(decode_payload(to_msgpack(missing)).success);

    nlohmann::json mistyped;
    mistyped["type"] = "SetObserver";
    mistyped["from"] = "a";
    mistyped["to"] = "b";
    mistyped["is_observer"] = "yes";
    EXPECT_FALSE(decode_payload(to_msgpack(mistyped)).success);

    nlohmann::json bad_address;
    bad_address["type"] = "AttemptConnection";
    bad_address["peer"] = "not an address";
    EXPECT_FALSE(decode_payload(to_msgpack(bad_address)).success);

    nlohmann::json no_type;
    no_type["name"] = "pilot";
    EXPECT_FALSE(decode_payload(to_msgpack(no_type)).success);
}

TEST_F(MessagesTest, GarbageNeverThrows) {
    std::vector<uint8_t> empty;
    EXPECT_FALSE(decode_payload(empty).success);

    std::vector<uint8_t> truncated = encode_payload(payloads::InitHandshake{"pilot", "1.0"});
    truncated.resize(truncated.size() / 2);
    EXPECT_FALSE(decode_payload(truncated).success);

    std::vector<uint8_t> noise = {0xC1, 0xFF, 0x00, 0x13, 0x37};
    EXPECT_FALSE(decode_payload(noise).success);

    // A valid msgpack document that is not an object
    EXPECT_FALSE(decode_payload(to_msgpack(nlohmann::json::array({1, 2, 3}))).success);
}

TEST_F(MessagesTest, ChannelSelection) {
    EXPECT_EQ(channel_for(payloads::Update{{1}, "a", true, 0.0}), Channel::Unreliable);
    EXPECT_EQ(channel_for(payloads::Update{{1}, "a", false, 0.0}), Channel::Reliable);
    EXPECT_EQ(channel_for(payloads::Handshake{"x"}), Channel::Unreliable);
    EXPECT_EQ(channel_for(payloads::Heartbeat{}), Channel::Unreliable);
    EXPECT_EQ(channel_for(payloads::InitHandshake{"a", "1"}), Channel::Reliable);
    EXPECT_EQ(channel_for(payloads::TransferControl{"a", "b"}), Channel::Reliable);
    EXPECT_EQ(channel_for(payloads::AircraftDefinition{{}}), Channel::Reliable);
}

TEST_F(MessagesTest, TypeNames) {
    EXPECT_STREQ(payload_type_name(payloads::Handshake{}), "Handshake");
    EXPECT_STREQ(payload_type_name(payloads::SetObserver{}), "SetObserver");
    EXPECT_STREQ(payload_type_name(payloads::Heartbeat{}), "Heartbeat");
}

TEST_F(MessagesTest, UnixTimeIsCurrent) {
    // 2020-01-01 as a sanity floor
    EXPECT_GT(unix_time_now(), 1577836800.0);
}
