#include <gtest/gtest.h>
#include "beamdrop/network/wire_protocol.hpp"
#include "beamdrop/core/error.hpp"

using namespace beamdrop::network;
using beamdrop::core::ErrorCode;
using beamdrop::core::TransferError;

class WireProtocolTest : public ::testing::Test {
protected:
    static ErrorCode parse_error(const std::string& frame) {
        try {
            parse_wire_message(frame);
        } catch (const TransferError& e) {
            return e.code();
        }
        return ErrorCode::SUCCESS;
    }
};

TEST_F(WireProtocolTest, MetadataFieldNames) {
    FileMetadataMessage msg;
    msg.file_id = "k3j9x0abc";
    msg.name = "photo.png";
    msg.size = 40000;
    msg.mime_type = "image/png";
    msg.total_chunks = 3;

    auto j = nlohmann::json::parse(msg.serialize());
    EXPECT_EQ(j["type"], "file-metadata");
    EXPECT_EQ(j["fileId"], "k3j9x0abc");
    EXPECT_EQ(j["name"], "photo.png");
    EXPECT_EQ(j["size"], 40000);
    EXPECT_EQ(j["mimeType"], "image/png");
    EXPECT_EQ(j["totalChunks"], 3);
}

TEST_F(WireProtocolTest, ChunkFieldNames) {
    FileChunkMessage msg;
    msg.file_id = "abc";
    msg.index = 2;
    msg.data = "Zm9v";
    msg.total_chunks = 3;

    auto j = nlohmann::json::parse(msg.serialize());
    EXPECT_EQ(j["type"], "file-chunk");
    EXPECT_EQ(j["fileId"], "abc");
    EXPECT_EQ(j["index"], 2);
    EXPECT_EQ(j["data"], "Zm9v");
    EXPECT_EQ(j["totalChunks"], 3);
}

TEST_F(WireProtocolTest, ParseDispatchesOnType) {
    auto metadata = parse_wire_message(
        R"({"type":"file-metadata","fileId":"f1","name":"a.txt","size":5,"mimeType":"text/plain","totalChunks":1})");
    ASSERT_TRUE(std::holds_alternative<FileMetadataMessage>(metadata));
    EXPECT_EQ(std::get<FileMetadataMessage>(metadata).name, "a.txt");

    auto chunk = parse_wire_message(R"({"type":"file-chunk","fileId":"f1","index":0,"data":"aGVsbG8=","totalChunks":1})");
    ASSERT_TRUE(std::holds_alternative<FileChunkMessage>(chunk));
    EXPECT_EQ(std::get<FileChunkMessage>(chunk).data, "aGVsbG8=");
}

TEST_F(WireProtocolTest, MissingMimeTypeIsEmpty) {
    auto parsed = parse_wire_message(R"({"type":"file-metadata","fileId":"f","name":"x","size":0,"totalChunks":1})");
    EXPECT_EQ(std::get<FileMetadataMessage>(parsed).mime_type, "");
}

TEST_F(WireProtocolTest, RejectsMalformedFrames) {
    EXPECT_EQ(parse_error("not json"), ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(parse_error("[1,2]"), ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(parse_error(R"({"fileId":"f"})"), ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(parse_error(R"({"type":"file-delete","fileId":"f"})"), ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(parse_error(R"({"type":"file-chunk","fileId":"f","index":0,"totalChunks":1})"),
              ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(parse_error(R"({"type":"file-chunk","fileId":"f","index":-1,"data":"","totalChunks":1})"),
              ErrorCode::PROTOCOL_ERROR);
    EXPECT_EQ(parse_error(R"({"type":"file-chunk","fileId":"f","index":"0","data":"","totalChunks":1})"),
              ErrorCode::PROTOCOL_ERROR);
}

TEST_F(WireProtocolTest, ChunkCount) {
    EXPECT_EQ(chunk_count(0, 16), 1);
    EXPECT_EQ(chunk_count(1, 16), 1);
    EXPECT_EQ(chunk_count(16, 16), 1);
    EXPECT_EQ(chunk_count(37, 16), 3);
    EXPECT_EQ(chunk_count(40000, DEFAULT_CHUNK_SIZE), 3);
    EXPECT_THROW(chunk_count(10, 0), std::invalid_argument);
}
