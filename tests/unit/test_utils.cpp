#include <gtest/gtest.h>
#include "beamdrop/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace beamdrop::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("a,b,c", ',');
    EXPECT_EQ(result.size(), 3);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");

    auto empty = StringUtils::split("", ',');
    EXPECT_EQ(empty.size(), 1);
    EXPECT_EQ(empty[0], "");
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::starts_with("hello world", "hello"));
    EXPECT_FALSE(StringUtils::starts_with("hello world", "world"));
    EXPECT_FALSE(StringUtils::starts_with("test", "testing"));
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
}

TEST_F(StringUtilsTest, FormatDuration) {
    using namespace std::chrono_literals;
    EXPECT_EQ(StringUtils::format_duration(250ms), "250ms");
    EXPECT_EQ(StringUtils::format_duration(42s), "42s");
    EXPECT_EQ(StringUtils::format_duration(125s), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(3720s), "1h 2m");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = "beamdrop_test_dir";
        std::filesystem::remove_all(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

TEST_F(FileUtilsTest, CreateDirectoriesAndWrite) {
    EXPECT_TRUE(FileUtils::create_directories(test_dir / "nested"));

    std::vector<std::uint8_t> bytes{0x00, 0xFF, 0x10};
    auto path = test_dir / "nested" / "data.bin";
    EXPECT_TRUE(FileUtils::write_binary_file(path, bytes));

    auto size = FileUtils::file_size(path);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 3);
}

TEST_F(FileUtilsTest, FileSizeOfMissingFile) {
    EXPECT_FALSE(FileUtils::file_size(test_dir / "missing.bin").has_value());
}

TEST_F(FileUtilsTest, UniquePathAvoidsCollisions) {
    FileUtils::create_directories(test_dir);

    auto first = FileUtils::unique_path(test_dir, "report.pdf");
    EXPECT_EQ(first, test_dir / "report.pdf");

    std::ofstream(first) << "x";
    auto second = FileUtils::unique_path(test_dir, "report.pdf");
    EXPECT_EQ(second, test_dir / "report (1).pdf");
}

TEST_F(FileUtilsTest, UniquePathStripsDirectories) {
    auto path = FileUtils::unique_path(test_dir, "../../etc/passwd");
    EXPECT_EQ(path, test_dir / "passwd");

    EXPECT_EQ(FileUtils::unique_path(test_dir, ".."), test_dir / "received.bin");
}

TEST_F(FileUtilsTest, GuessMimeType) {
    EXPECT_EQ(FileUtils::guess_mime_type("notes.TXT"), "text/plain");
    EXPECT_EQ(FileUtils::guess_mime_type("photo.jpeg"), "image/jpeg");
    EXPECT_EQ(FileUtils::guess_mime_type("blob"), "application/octet-stream");
}

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, IsoRoundTrip) {
    auto parsed = TimeUtils::from_iso_string("2024-03-01T12:30:45Z");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(TimeUtils::to_iso_string(*parsed), "2024-03-01T12:30:45Z");
}

TEST_F(TimeUtilsTest, RejectsGarbage) {
    EXPECT_FALSE(TimeUtils::from_iso_string("yesterday").has_value());
}
