#include <gtest/gtest.h>
#include "beamdrop/transfer/file_sender.hpp"
#include "beamdrop/crypto/encoding.hpp"
#include "support/loopback_transport.hpp"
#include "support/test_helpers.hpp"

using namespace beamdrop::transfer;
using namespace std::chrono_literals;
using beamdrop::core::ErrorCode;
using beamdrop::core::Result;
using beamdrop::core::TransferError;
using beamdrop::network::ChannelState;
using beamdrop::testing::LoopbackDataChannel;
using beamdrop::testing::run_until;

namespace {
    class FailingSource : public ByteSource {
    public:
        std::uint64_t size() const override { return 64; }
        const std::string& name() const override { return name_; }
        const std::string& mime_type() const override { return mime_; }
        std::vector<std::uint8_t> read(std::uint64_t, std::size_t) override {
            throw TransferError(ErrorCode::FILE_READ_ERROR, "disk unplugged");
        }

    private:
        std::string name_ = "broken.bin";
        std::string mime_ = "application/octet-stream";
    };
}

class FileSenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        channel_ = std::make_shared<LoopbackDataChannel>(io_, "fileTransfer", ChannelState::OPEN);
    }

    std::shared_ptr<ByteSource> source_of(std::size_t size) {
        std::vector<std::uint8_t> data(size);
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::uint8_t>(i);
        }
        return std::make_shared<MemoryByteSource>("data.bin", "application/octet-stream", data);
    }

    bool wait_for(std::future<Result>& future) {
        return run_until(io_, [&] { return future.wait_for(0s) == std::future_status::ready; });
    }

    boost::asio::io_context io_;
    std::shared_ptr<LoopbackDataChannel> channel_;
};

TEST_F(FileSenderTest, SendsMetadataThenChunksInOrder) {
    FileSender sender(io_, SenderOptions{16, 1ms});

    auto future = sender.send("bob", channel_, source_of(37));
    EXPECT_TRUE(sender.is_sending("bob"));
    ASSERT_TRUE(wait_for(future));
    EXPECT_TRUE(future.get().success());
    EXPECT_FALSE(sender.is_sending("bob"));

    const auto& frames = channel_->sent();
    ASSERT_EQ(frames.size(), 4);

    auto metadata = nlohmann::json::parse(frames[0]);
    EXPECT_EQ(metadata["type"], "file-metadata");
    EXPECT_EQ(metadata["size"], 37);
    EXPECT_EQ(metadata["totalChunks"], 3);
    EXPECT_EQ(metadata["fileId"].get<std::string>().size(), 9);

    std::vector<std::uint8_t> reassembled;
    for (std::size_t i = 1; i < frames.size(); ++i) {
        auto chunk = nlohmann::json::parse(frames[i]);
        EXPECT_EQ(chunk["type"], "file-chunk");
        EXPECT_EQ(chunk["fileId"], metadata["fileId"]);
        EXPECT_EQ(chunk["index"], i - 1);
        EXPECT_EQ(chunk["totalChunks"], 3);
        auto bytes = beamdrop::crypto::base64_decode(chunk["data"].get<std::string>());
        ASSERT_TRUE(bytes.has_value());
        reassembled.insert(reassembled.end(), bytes->begin(), bytes->end());
    }
    EXPECT_EQ(reassembled, source_of(37)->read(0, 37));
}

TEST_F(FileSenderTest, ProgressIsMonotonicAndEndsAtHundred) {
    FileSender sender(io_, SenderOptions{10, 0ms});
    std::vector<ProgressUpdate> updates;

    auto future = sender.send("bob", channel_, source_of(95),
                              [&](const ProgressUpdate& update) { updates.push_back(update); });
    ASSERT_TRUE(wait_for(future));

    ASSERT_EQ(updates.size(), 10);
    for (std::size_t i = 1; i < updates.size(); ++i) {
        EXPECT_GE(updates[i].progress_percent, updates[i - 1].progress_percent);
        EXPECT_GT(updates[i].bytes_transferred, updates[i - 1].bytes_transferred);
    }
    EXPECT_EQ(updates.back().progress_percent, 100);
    EXPECT_EQ(updates.back().bytes_transferred, 95);
    EXPECT_EQ(updates.back().direction, TransferDirection::SENDING);
    EXPECT_EQ(updates.back().peer_id, "bob");
}

TEST_F(FileSenderTest, ChunksArePaced) {
    FileSender sender(io_, SenderOptions{8, 20ms});

    auto start = std::chrono::steady_clock::now();
    auto future = sender.send("bob", channel_, source_of(32));
    ASSERT_TRUE(wait_for(future));

    // Four chunks: the first goes out at once, three delays follow.
    EXPECT_GE(std::chrono::steady_clock::now() - start, 60ms);
}

TEST_F(FileSenderTest, EmptyFileSendsOneChunk) {
    FileSender sender(io_, SenderOptions{16, 0ms});
    int progress_calls = 0;
    std::uint32_t last_percent = 0;

    auto future = sender.send("bob", channel_, source_of(0), [&](const ProgressUpdate& update) {
        ++progress_calls;
        last_percent = update.progress_percent;
    });
    ASSERT_TRUE(wait_for(future));

    EXPECT_TRUE(future.get().success());
    ASSERT_EQ(channel_->sent().size(), 2);
    EXPECT_EQ(nlohmann::json::parse(channel_->sent()[1])["data"], "");
    EXPECT_EQ(progress_calls, 1);
    EXPECT_EQ(last_percent, 100);
}

TEST_F(FileSenderTest, RejectsChannelThatIsNotOpen) {
    FileSender sender(io_);
    auto connecting = std::make_shared<LoopbackDataChannel>(io_, "fileTransfer");

    try {
        sender.send("bob", connecting, source_of(10));
        FAIL() << "expected CHANNEL_NOT_READY";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CHANNEL_NOT_READY);
    }

    EXPECT_THROW(sender.send("bob", nullptr, source_of(10)), TransferError);
    EXPECT_TRUE(connecting->sent().empty());
}

TEST_F(FileSenderTest, RejectsSecondTransferToSamePeer) {
    FileSender sender(io_, SenderOptions{4, 5ms});
    auto first = sender.send("bob", channel_, source_of(40));

    try {
        sender.send("bob", channel_, source_of(10));
        FAIL() << "expected TRANSFER_BUSY";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.code(), ErrorCode::TRANSFER_BUSY);
    }

    auto other = std::make_shared<LoopbackDataChannel>(io_, "fileTransfer", ChannelState::OPEN);
    auto second = sender.send("carol", other, source_of(10));
    EXPECT_EQ(sender.active_count(), 2);

    ASSERT_TRUE(wait_for(first));
    ASSERT_TRUE(wait_for(second));
    EXPECT_TRUE(first.get().success());
    EXPECT_TRUE(second.get().success());
}

TEST_F(FileSenderTest, ChannelClosedMidTransferAborts) {
    FileSender sender(io_, SenderOptions{4, 1ms});

    auto future = sender.send("bob", channel_, source_of(40), [&](const ProgressUpdate& update) {
        if (update.bytes_transferred == 8) {
            channel_->close();
        }
    });
    ASSERT_TRUE(wait_for(future));

    auto result = future.get();
    EXPECT_EQ(result.error, ErrorCode::TRANSFER_ABORTED);
    EXPECT_EQ(channel_->sent().size(), 3);
    EXPECT_FALSE(sender.is_sending("bob"));
}

TEST_F(FileSenderTest, FailedChunkSendAborts) {
    FileSender sender(io_, SenderOptions{4, 0ms});
    channel_->fail_sends_after(2);

    auto future = sender.send("bob", channel_, source_of(40));
    ASSERT_TRUE(wait_for(future));

    EXPECT_EQ(future.get().error, ErrorCode::TRANSFER_ABORTED);
    EXPECT_EQ(channel_->sent().size(), 2);
}

TEST_F(FileSenderTest, FailedMetadataSendAbortsImmediately) {
    FileSender sender(io_);
    channel_->fail_sends_after(0);

    auto future = sender.send("bob", channel_, source_of(40));

    ASSERT_EQ(future.wait_for(0s), std::future_status::ready);
    EXPECT_EQ(future.get().error, ErrorCode::TRANSFER_ABORTED);
    EXPECT_FALSE(sender.is_sending("bob"));
}

TEST_F(FileSenderTest, ReadErrorFailsTransfer) {
    FileSender sender(io_);

    auto future = sender.send("bob", channel_, std::make_shared<FailingSource>());
    ASSERT_TRUE(wait_for(future));

    auto result = future.get();
    EXPECT_EQ(result.error, ErrorCode::FILE_READ_ERROR);
    EXPECT_EQ(channel_->sent().size(), 1);
}

TEST_F(FileSenderTest, AbortResolvesFuture) {
    FileSender sender(io_, SenderOptions{4, 50ms});

    auto future = sender.send("bob", channel_, source_of(400));
    run_until(io_, [&] { return channel_->sent().size() >= 2; });

    sender.abort("bob", "user cancelled");

    ASSERT_EQ(future.wait_for(0s), std::future_status::ready);
    auto result = future.get();
    EXPECT_EQ(result.error, ErrorCode::TRANSFER_ABORTED);
    EXPECT_EQ(result.message, "user cancelled");

    auto sent = channel_->sent().size();
    run_until(io_, [] { return false; }, 120ms);
    EXPECT_EQ(channel_->sent().size(), sent);
}

TEST_F(FileSenderTest, ZeroChunkSizeIsRejected) {
    EXPECT_THROW(FileSender(io_, SenderOptions{0, 1ms}), std::invalid_argument);
}
