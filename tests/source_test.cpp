#include "prose/text/source.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace prose;
namespace fs = std::filesystem;

TEST(SourceTest, FromStrHasNoPath) {
    auto source = Source::from_str("key = value");
    EXPECT_EQ(source.source_text(), "key = value");
    EXPECT_FALSE(source.source_path().has_value());
    EXPECT_EQ(source.len(), 11u);
}

TEST(SourceTest, ForwardsCharacterOperations) {
    auto source = Source::from_str("naïve");
    EXPECT_EQ(source.len(), 5u);
    EXPECT_EQ(source.byte_len(), 6u);
    EXPECT_EQ(source.char_at(2), U'ï');
    EXPECT_EQ(source.slice(1, 3).as_str(), "aï");
    EXPECT_EQ(source.slice_from(3).as_str(), "ve");
    EXPECT_EQ(source.slice_to(2).as_str(), "na");
    EXPECT_EQ(source.text().len(), 5u);
}

TEST(SourceTest, SetPath) {
    auto source = Source::from_str("x");
    source.set_path(fs::path("config/app.conf"));
    ASSERT_TRUE(source.source_path().has_value());
    EXPECT_EQ(source.source_path()->string(), "config/app.conf");
    source.set_path(std::nullopt);
    EXPECT_FALSE(source.source_path().has_value());
}

TEST(SourceTest, EqualityComparesTextAndPath) {
    auto a = Source::from_str("abc");
    auto b = Source::from_str("abc");
    EXPECT_EQ(a, b);
    b.set_path(fs::path("b.txt"));
    EXPECT_FALSE(a == b);
    EXPECT_FALSE(Source::from_str("abc") == Source::from_str("abd"));
}

// ============================================================================
// File Loading
// ============================================================================

class SourceFileTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "prose_source_test.txt";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void write_file(const std::string& content) {
        std::ofstream f(temp_file, std::ios::binary);
        f << content;
    }
};

TEST_F(SourceFileTest, LoadsTextAndPath) {
    write_file("line one\nline two\n");
    auto loaded = Source::from_file(temp_file);
    ASSERT_TRUE(is_ok(loaded));
    const auto& source = unwrap(loaded);
    EXPECT_EQ(source.source_text(), "line one\nline two\n");
    ASSERT_TRUE(source.source_path().has_value());
    EXPECT_EQ(*source.source_path(), temp_file);
}

TEST_F(SourceFileTest, MissingFileIsIoError) {
    auto loaded = Source::from_file(temp_file);
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded), std::errc::no_such_file_or_directory);
}

TEST_F(SourceFileTest, DirectoryIsRejected) {
    auto loaded = Source::from_file(fs::temp_directory_path());
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded), std::errc::is_a_directory);
}

TEST_F(SourceFileTest, InvalidUtf8IsRejected) {
    write_file("ok\xFF\xFE");
    auto loaded = Source::from_file(temp_file);
    ASSERT_TRUE(is_err(loaded));
    EXPECT_EQ(unwrap_err(loaded), std::errc::illegal_byte_sequence);
}
