#include <gtest/gtest.h>
#include "beamdrop/signaling/relay_hub.hpp"
#include "beamdrop/signaling/signal_envelope.hpp"
#include <algorithm>
#include <map>

using namespace beamdrop::signaling;

class RelayHubTest : public ::testing::Test {
protected:
    RelayHub::FrameSink sink_for(const std::string& peer_id) {
        return [this, peer_id](const std::string& frame) {
            inbox_[peer_id].push_back(SignalEnvelope::parse(frame));
        };
    }

    std::uint64_t join(const std::string& peer_id) {
        return hub_.join(peer_id, sink_for(peer_id));
    }

    const SignalEnvelope& last(const std::string& peer_id) {
        return inbox_[peer_id].back();
    }

    RelayHub hub_;
    std::map<std::string, std::vector<SignalEnvelope>> inbox_;
};

TEST_F(RelayHubTest, JoinBroadcastsRosterToEveryone) {
    join("alice");
    join("bob");

    ASSERT_EQ(inbox_["alice"].size(), 2);
    ASSERT_EQ(inbox_["bob"].size(), 1);

    const auto& roster = last("alice");
    EXPECT_EQ(roster.type, SignalType::ONLINE_USERS);
    ASSERT_EQ(roster.payload.size(), 2);
    EXPECT_EQ(roster.payload[0]["displayName"], "Anonymous");
    EXPECT_TRUE(roster.payload[0].contains("connectedAt"));
}

TEST_F(RelayHubTest, LeaveBroadcastsRoster) {
    auto alice = join("alice");
    join("bob");

    hub_.leave("alice", alice);

    EXPECT_FALSE(hub_.is_online("alice"));
    const auto& roster = last("bob");
    ASSERT_EQ(roster.payload.size(), 1);
    EXPECT_EQ(roster.payload[0]["id"], "bob");
}

TEST_F(RelayHubTest, DuplicateIdentityReplacesConnection) {
    auto first = join("alice");
    auto second = join("alice");
    EXPECT_NE(first, second);
    EXPECT_EQ(hub_.participant_count(), 1);

    // The replaced connection's leave must not evict the new one.
    hub_.leave("alice", first);
    EXPECT_TRUE(hub_.is_online("alice"));

    hub_.leave("alice", second);
    EXPECT_FALSE(hub_.is_online("alice"));
}

TEST_F(RelayHubTest, UpdateInfoRenamesParticipant) {
    join("alice");
    join("bob");

    hub_.handle_frame("alice", SignalEnvelope::update_info("Alice", "🦊").serialize());

    const auto& roster = last("bob");
    auto it = std::find_if(roster.payload.begin(), roster.payload.end(),
                           [](const nlohmann::json& u) { return u["id"] == "alice"; });
    ASSERT_NE(it, roster.payload.end());
    EXPECT_EQ((*it)["displayName"], "Alice");
    EXPECT_EQ((*it)["emoji"], "🦊");
}

TEST_F(RelayHubTest, ForwardsSignalsWithSender) {
    join("alice");
    join("bob");
    auto before = inbox_["alice"].size();

    auto offer = SignalEnvelope::offer("bob", beamdrop::network::SessionDescription{"offer", "sdp-a"});
    hub_.handle_frame("alice", offer.serialize());

    EXPECT_EQ(inbox_["alice"].size(), before);
    const auto& forwarded = last("bob");
    EXPECT_EQ(forwarded.type, SignalType::OFFER);
    EXPECT_EQ(forwarded.sender, "alice");
    EXPECT_TRUE(forwarded.target.empty());
    EXPECT_EQ(forwarded.payload["sdp"], "sdp-a");
}

TEST_F(RelayHubTest, DropsSignalsForOfflineTargets) {
    join("alice");
    auto before = inbox_["alice"].size();

    hub_.handle_frame("alice", SignalEnvelope::offer("ghost", {"offer", "x"}).serialize());
    hub_.handle_frame("alice", "garbage");
    hub_.handle_frame("stranger", SignalEnvelope::update_info("x", "").serialize());

    EXPECT_EQ(inbox_["alice"].size(), before);
    EXPECT_FALSE(hub_.is_online("stranger"));
}

TEST_F(RelayHubTest, SinkFailureDoesNotStopBroadcast) {
    hub_.join("broken", [](const std::string&) { throw std::runtime_error("socket gone"); });
    join("bob");

    EXPECT_EQ(hub_.participant_count(), 2);
    EXPECT_EQ(last("bob").payload.size(), 2);
}
