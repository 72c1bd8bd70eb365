#include <gtest/gtest.h>
#include "beamdrop/signaling/signal_envelope.hpp"
#include "beamdrop/core/error.hpp"

using namespace beamdrop::signaling;
using beamdrop::network::IceCandidate;
using beamdrop::network::SessionDescription;

class SignalEnvelopeTest : public ::testing::Test {};

TEST_F(SignalEnvelopeTest, OfferCarriesTargetAndDescription) {
    auto envelope = SignalEnvelope::offer("bob", SessionDescription{"offer", "v=0..."});
    auto j = nlohmann::json::parse(envelope.serialize());

    EXPECT_EQ(j["type"], "offer");
    EXPECT_EQ(j["target"], "bob");
    EXPECT_FALSE(j.contains("sender"));
    EXPECT_EQ(j["payload"]["type"], "offer");
    EXPECT_EQ(j["payload"]["sdp"], "v=0...");
}

TEST_F(SignalEnvelopeTest, IceCandidateTypeName) {
    auto envelope = SignalEnvelope::ice_candidate("bob", IceCandidate{"candidate:1 1 udp 1 1.2.3.4 5 typ host", "0"});
    auto j = nlohmann::json::parse(envelope.serialize());

    EXPECT_EQ(j["type"], "ice-candidate");
    EXPECT_EQ(j["payload"]["candidate"], "candidate:1 1 udp 1 1.2.3.4 5 typ host");
    EXPECT_EQ(j["payload"]["sdpMid"], "0");
}

TEST_F(SignalEnvelopeTest, UpdateInfoIsFlat) {
    auto j = nlohmann::json::parse(SignalEnvelope::update_info("Ada", "🚀").serialize());

    EXPECT_EQ(j["type"], "update_info");
    EXPECT_EQ(j["displayName"], "Ada");
    EXPECT_EQ(j["emoji"], "🚀");
    EXPECT_FALSE(j.contains("payload"));
}

TEST_F(SignalEnvelopeTest, ParseForwardedAnswer) {
    auto envelope = SignalEnvelope::parse(
        R"({"type":"answer","sender":"alice","payload":{"type":"answer","sdp":"x"}})");

    EXPECT_EQ(envelope.type, SignalType::ANSWER);
    EXPECT_EQ(envelope.sender, "alice");
    EXPECT_TRUE(envelope.target.empty());
    EXPECT_EQ(envelope.payload.get<SessionDescription>().sdp, "x");
}

TEST_F(SignalEnvelopeTest, ParseUpdateInfoAcceptsUsername) {
    auto envelope = SignalEnvelope::parse(R"({"type":"update_info","username":"Grace","emoji":"🐢"})");

    EXPECT_EQ(envelope.type, SignalType::UPDATE_INFO);
    EXPECT_EQ(envelope.payload["displayName"], "Grace");
    EXPECT_EQ(envelope.payload["emoji"], "🐢");
}

TEST_F(SignalEnvelopeTest, ParseOnlineUsersList) {
    auto envelope = SignalEnvelope::parse(R"({"type":"online_users","users":[{"id":"a"}]})");

    EXPECT_EQ(envelope.type, SignalType::ONLINE_USERS);
    ASSERT_TRUE(envelope.payload.is_array());
    EXPECT_EQ(envelope.payload.size(), 1);
}

TEST_F(SignalEnvelopeTest, UnknownTypeIsKept) {
    auto envelope = SignalEnvelope::parse(R"({"type":"chat","payload":"hi"})");

    EXPECT_EQ(envelope.type, SignalType::UNKNOWN);
    EXPECT_EQ(envelope.type_name, "chat");
}

TEST_F(SignalEnvelopeTest, MalformedFramesThrow) {
    EXPECT_THROW(SignalEnvelope::parse("{"), beamdrop::core::TransferError);
    EXPECT_THROW(SignalEnvelope::parse(R"({"payload":{}})"), beamdrop::core::TransferError);
    EXPECT_THROW(SignalEnvelope::parse(R"({"type":5})"), beamdrop::core::TransferError);
}
