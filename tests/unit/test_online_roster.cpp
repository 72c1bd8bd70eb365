#include <gtest/gtest.h>
#include "beamdrop/signaling/online_roster.hpp"

using namespace beamdrop::signaling;

class OnlineRosterTest : public ::testing::Test {
protected:
    void SetUp() override {
        roster_.on_change().subscribe([this](const std::vector<OnlineUser>& users) {
            snapshots_.push_back(users);
        });
    }

    OnlineRoster roster_{"me"};
    std::vector<std::vector<OnlineUser>> snapshots_;
};

TEST_F(OnlineRosterTest, ExcludesLocalIdentity) {
    roster_.handle_broadcast(nlohmann::json::parse(R"([
        {"id":"me","displayName":"Me"},
        {"id":"bob","displayName":"Bob","emoji":"🐻","connectedAt":"2024-01-01T00:00:00Z"}
    ])"));

    ASSERT_EQ(roster_.size(), 1);
    EXPECT_FALSE(roster_.contains("me"));

    auto bob = roster_.find("bob");
    ASSERT_TRUE(bob.has_value());
    EXPECT_EQ(bob->display_name, "Bob");
    EXPECT_EQ(bob->emoji, "🐻");
    EXPECT_NE(bob->connected_at.time_since_epoch().count(), 0);
}

TEST_F(OnlineRosterTest, AcceptsAlternateFieldNames) {
    roster_.handle_broadcast(nlohmann::json::parse(R"([{"peerId":"carol","username":"Carol"}])"));

    auto carol = roster_.find("carol");
    ASSERT_TRUE(carol.has_value());
    EXPECT_EQ(carol->display_name, "Carol");
}

TEST_F(OnlineRosterTest, TracksJoinAndLeave) {
    roster_.handle_broadcast(nlohmann::json::parse(R"([{"id":"me"}])"));
    roster_.handle_broadcast(nlohmann::json::parse(R"([{"id":"me"},{"id":"bob"}])"));
    roster_.handle_broadcast(nlohmann::json::parse(R"([{"id":"me"}])"));

    ASSERT_EQ(snapshots_.size(), 3);
    EXPECT_TRUE(snapshots_[0].empty());
    ASSERT_EQ(snapshots_[1].size(), 1);
    EXPECT_EQ(snapshots_[1][0].peer_id, "bob");
    EXPECT_TRUE(snapshots_[2].empty());
}

TEST_F(OnlineRosterTest, SkipsMalformedEntries) {
    roster_.handle_broadcast(nlohmann::json::parse(R"([{"displayName":"nobody"}, 7, {"id":"bob"}])"));

    EXPECT_EQ(roster_.size(), 1);
    EXPECT_TRUE(roster_.contains("bob"));
}

TEST_F(OnlineRosterTest, IgnoresNonArrayBroadcast) {
    roster_.handle_broadcast(nlohmann::json::parse(R"([{"id":"bob"}])"));
    roster_.handle_broadcast(nlohmann::json::parse(R"({"id":"carol"})"));

    EXPECT_EQ(snapshots_.size(), 1);
    EXPECT_TRUE(roster_.contains("bob"));
}
