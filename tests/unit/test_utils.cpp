#include <gtest/gtest.h>
#include "mediapush/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace mediapush::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("\t hello\r\n"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Movie.MP4"), "movie.mp4");
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::starts_with("hello world", "hello"));
    EXPECT_FALSE(StringUtils::starts_with("test", "testing"));
}

TEST_F(StringUtilsTest, IsInteger) {
    EXPECT_TRUE(StringUtils::is_integer("0"));
    EXPECT_TRUE(StringUtils::is_integer("12345"));
    EXPECT_TRUE(StringUtils::is_integer("-1001234567890"));
    EXPECT_FALSE(StringUtils::is_integer(""));
    EXPECT_FALSE(StringUtils::is_integer("-"));
    EXPECT_FALSE(StringUtils::is_integer("+5"));
    EXPECT_FALSE(StringUtils::is_integer("12a"));
    EXPECT_FALSE(StringUtils::is_integer("@channel"));
}

TEST_F(StringUtilsTest, Utf8TailKeepsShortStrings) {
    EXPECT_EQ(StringUtils::utf8_tail("short.mp4", 60), "short.mp4");
    EXPECT_EQ(StringUtils::utf8_tail("", 60), "");
}

TEST_F(StringUtilsTest, Utf8TailCutsFromTheFront) {
    EXPECT_EQ(StringUtils::utf8_tail("abcdefgh", 3), "fgh");
}

TEST_F(StringUtilsTest, Utf8TailCountsCharactersNotBytes) {
    // "é" is two bytes, "€" three.
    std::string name = "a\xC3\xA9\xE2\x82\xAC" "b";
    EXPECT_EQ(StringUtils::utf8_tail(name, 3), "\xC3\xA9\xE2\x82\xAC" "b");
    EXPECT_EQ(StringUtils::utf8_tail(name, 2), "\xE2\x82\xAC" "b");
    EXPECT_EQ(StringUtils::utf8_tail(name, 10), name);
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "mediapush_utils_test";
        std::filesystem::create_directories(test_dir);
        test_file = test_dir / "file.bin";
        std::ofstream(test_file, std::ios::binary) << std::string(1000, 'x');
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }
    
    std::filesystem::path test_dir;
    std::filesystem::path test_file;
};

TEST_F(FileUtilsTest, IsDirectory) {
    EXPECT_TRUE(FileUtils::is_directory(test_dir));
    EXPECT_FALSE(FileUtils::is_directory(test_file));
    EXPECT_FALSE(FileUtils::is_directory(test_dir / "missing"));
}

TEST_F(FileUtilsTest, FileSize) {
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 1000u);
    EXPECT_FALSE(FileUtils::file_size(test_dir / "missing").has_value());
}

TEST_F(FileUtilsTest, ExpandUser) {
    auto home = FileUtils::get_home_dir();
    EXPECT_EQ(FileUtils::expand_user("~"), home);
    EXPECT_EQ(FileUtils::expand_user("~/videos"), home / "videos");
    EXPECT_EQ(FileUtils::expand_user("/abs/path"), std::filesystem::path("/abs/path"));
    EXPECT_EQ(FileUtils::expand_user("relative~/x"), std::filesystem::path("relative~/x"));
}
