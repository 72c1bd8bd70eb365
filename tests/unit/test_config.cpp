#include <gtest/gtest.h>
#include "beamdrop/core/config.hpp"
#include "beamdrop/core/peer_session.hpp"
#include <fstream>
#include <filesystem>

using namespace beamdrop::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_beamdrop_config.txt";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }

    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();

    config.set("test.key", "test_value");

    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();

    auto value = config.get("nonexistent.key");
    EXPECT_FALSE(value.has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();

    config.set("bool.true", "yes");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("int.garbage", "42abc");

    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_int("int.garbage", 7), 7);
}

TEST_F(ConfigTest, GetList) {
    auto& config = Config::instance();

    config.set("ice.stun_servers", " stun:a.example:3478 ,, stun:b.example:3478");

    auto servers = config.get_list("ice.stun_servers");
    ASSERT_EQ(servers.size(), 2);
    EXPECT_EQ(servers[0], "stun:a.example:3478");
    EXPECT_EQ(servers[1], "stun:b.example:3478");
    EXPECT_TRUE(config.get_list("missing").empty());
}

TEST_F(ConfigTest, Defaults) {
    auto& config = Config::instance();
    config.set_defaults();

    EXPECT_EQ(config.get_string("relay.host"), "127.0.0.1");
    EXPECT_EQ(config.get_int("relay.port"), 8001);
    EXPECT_EQ(config.get_int("relay.reconnect.max_attempts"), 5);
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 16384);
    EXPECT_EQ(config.get_int("transfer.chunk_delay_ms"), 10);
    EXPECT_EQ(config.get_string("transfer.completion_policy"), "last_index");
    EXPECT_EQ(config.get_list("ice.stun_servers").size(), 2);
}

TEST_F(ConfigTest, LoadFromFileOverridesDefaults) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "relay.host = relay.example.org \n";
    file << "transfer.chunk_size=4096\n";
    file << "not a setting\n";
    file.close();

    auto& config = Config::instance();
    config.set_defaults();
    EXPECT_TRUE(config.load_from_file(test_file));

    EXPECT_EQ(config.get_string("relay.host"), "relay.example.org");
    EXPECT_EQ(config.get_int("transfer.chunk_size"), 4096);
    EXPECT_EQ(config.get_int("relay.port"), 8001);
    EXPECT_FALSE(config.contains("not a setting"));
}

TEST_F(ConfigTest, LoadMissingFile) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");

    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));

    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, SessionOptionsFromConfig) {
    Config config;
    config.set_defaults();
    config.set("transfer.chunk_size", "1024");
    config.set("transfer.chunk_delay_ms", "0");
    config.set("transfer.completion_policy", "all_chunks");
    config.set("user.display_name", "Ada");

    auto options = SessionOptions::from_config(config, "peer-1");

    EXPECT_EQ(options.local_id, "peer-1");
    EXPECT_EQ(options.display_name, "Ada");
    EXPECT_EQ(options.sender.chunk_size, 1024);
    EXPECT_EQ(options.sender.chunk_delay.count(), 0);
    EXPECT_EQ(options.receiver.completion_policy, beamdrop::transfer::CompletionPolicy::ALL_CHUNKS);
}
