#include <gtest/gtest.h>
#include "beamdrop/core/cli.hpp"
#include "beamdrop/core/command_handler.hpp"
#include "beamdrop/core/command_registry.hpp"

using namespace beamdrop::core;

class CommandLineTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "beamdrop");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        return parser_.parse(static_cast<int>(argv_.size()), argv_.data());
    }

    CommandLineParser parser_{"beamdrop"};
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(CommandLineTest, ParsesLongAndShortOptions) {
    ASSERT_TRUE(parse({"--name=Ada", "-e", "🚀", "--verbose", "send", "bob", "file.txt"}));

    EXPECT_EQ(parser_.get_option("name"), "Ada");
    EXPECT_EQ(parser_.get_option("emoji"), "🚀");
    EXPECT_TRUE(parser_.get_bool_option("verbose"));
    EXPECT_EQ(parser_.get_positional_args(), (std::vector<std::string>{"send", "bob", "file.txt"}));
}

TEST_F(CommandLineTest, DefaultValues) {
    ASSERT_TRUE(parse({"peers"}));

    EXPECT_FALSE(parser_.has_option("config"));
    EXPECT_EQ(parser_.get_option("config"), "beamdrop.conf");
    EXPECT_EQ(parser_.get_int_option("port", 9000), 9000);
}

TEST_F(CommandLineTest, UnknownOptionFails) {
    EXPECT_FALSE(parse({"--turbo"}));
    EXPECT_EQ(parser_.get_error(), "Unknown option: --turbo");
}

TEST_F(CommandLineTest, MissingValueFails) {
    EXPECT_FALSE(parse({"--relay"}));
    EXPECT_FALSE(parser_.get_error().empty());
}

TEST_F(CommandLineTest, OverridesLandInConfig) {
    ASSERT_TRUE(parse({"-r", "relay.example.org:9001", "--id", "peer-7", "-o", "/tmp/in", "receive"}));

    Config config;
    config.set_defaults();
    EXPECT_FALSE(apply_config_overrides(parser_, config).has_value());

    EXPECT_EQ(config.get_string("relay.host"), "relay.example.org");
    EXPECT_EQ(config.get_int("relay.port"), 9001);
    EXPECT_EQ(config.get_string("user.id"), "peer-7");
    EXPECT_EQ(config.get_string("transfer.download_dir"), "/tmp/in");
    EXPECT_EQ(config.get_string("user.display_name"), "Anonymous");
}

TEST_F(CommandLineTest, RelayWithoutPortKeepsConfiguredPort) {
    ASSERT_TRUE(parse({"--relay", "10.0.0.5"}));

    Config config;
    config.set("relay.port", "7000");
    EXPECT_FALSE(apply_config_overrides(parser_, config).has_value());

    EXPECT_EQ(config.get_string("relay.host"), "10.0.0.5");
    EXPECT_EQ(config.get_int("relay.port"), 7000);
}

TEST_F(CommandLineTest, InvalidOverridesAreReported) {
    Config config;

    ASSERT_TRUE(parse({"--relay", "host:http"}));
    EXPECT_TRUE(apply_config_overrides(parser_, config).has_value());

    ASSERT_TRUE(parse({"--port", "70000"}));
    EXPECT_TRUE(apply_config_overrides(parser_, config).has_value());
}

TEST(RelayAddressTest, Parse) {
    auto full = parse_relay_address("example.com:8443", 8001);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->host, "example.com");
    EXPECT_EQ(full->port, 8443);

    auto bare = parse_relay_address("example.com", 8001);
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->port, 8001);

    EXPECT_FALSE(parse_relay_address("", 8001).has_value());
    EXPECT_FALSE(parse_relay_address(":8001", 8001).has_value());
    EXPECT_FALSE(parse_relay_address("host:", 8001).has_value());
    EXPECT_FALSE(parse_relay_address("host:65536", 8001).has_value());
}

namespace {
    class EchoCommand : public CommandHandler {
    public:
        CommandResult execute(const std::vector<std::string>& args) override {
            return CommandResult::ok(std::to_string(args.size()));
        }
        std::string get_description() const override { return "Echo"; }
        std::string get_usage() const override { return "echo [args...]"; }
    };
}

TEST(CommandRegistryTest, DispatchesByName) {
    CommandRegistry registry;
    registry.register_command("echo", std::make_unique<EchoCommand>());

    EXPECT_TRUE(registry.has_command("echo"));
    auto result = registry.execute_command("echo", {"echo", "a", "b"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "3");

    auto unknown = registry.execute_command("nope", {});
    EXPECT_FALSE(unknown.success);
    EXPECT_EQ(unknown.exit_code, 1);
}
