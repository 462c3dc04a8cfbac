#include "utils/filesystem.hpp"
#include "temp_tree.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;
namespace utils = eolnorm::utils;

class FilesystemTest : public eolnorm::testing::TempTree {};

TEST_F(FilesystemTest, ReadsBytesExactly) {
    const std::string content("a\r\nb\0c\r", 7);
    auto path = write("data.bin", content);
    EXPECT_EQ(utils::read_file_bytes(path), content);
}

TEST_F(FilesystemTest, ReadingMissingFileThrows) {
    EXPECT_THROW(utils::read_file_bytes(root() / "nope.txt"), std::runtime_error);
}

TEST_F(FilesystemTest, SizeMismatchThrows) {
    // procfs reports size 0 for files that do have content
    const fs::path status_file = "/proc/self/status";
    if (!fs::exists(status_file)) {
        GTEST_SKIP() << "no procfs";
    }
    EXPECT_THROW(utils::read_file_bytes(status_file), std::runtime_error);
}

TEST_F(FilesystemTest, ListsEntriesSortedByName) {
    write("b.txt", "");
    write("a.txt", "");
    write("C.txt", "");
    fs::create_directories(root() / "dir");

    auto entries = utils::list_entries(root());
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].path().filename().string(), "C.txt");
    EXPECT_EQ(entries[1].path().filename().string(), "a.txt");
    EXPECT_EQ(entries[2].path().filename().string(), "b.txt");
    EXPECT_EQ(entries[3].path().filename().string(), "dir");
}

TEST_F(FilesystemTest, ListingMissingDirectoryThrows) {
    EXPECT_THROW(utils::list_entries(root() / "missing"), fs::filesystem_error);
}

TEST(FilesystemNameTest, HiddenNames) {
    EXPECT_TRUE(utils::is_hidden(".git"));
    EXPECT_TRUE(utils::is_hidden("src/.env"));
    EXPECT_FALSE(utils::is_hidden("src/main.rs"));
    EXPECT_FALSE(utils::is_hidden("."));
    EXPECT_FALSE(utils::is_hidden(".."));
    EXPECT_FALSE(utils::is_hidden("a.b"));
}

TEST(FilesystemNameTest, NormalizesExtensions) {
    EXPECT_EQ(utils::normalize_extension(".RS"), "rs");
    EXPECT_EQ(utils::normalize_extension("Txt"), "txt");
    EXPECT_EQ(utils::normalize_extension(""), "");

    auto set = utils::normalize_extensions({"rs", ".RS", ".", "md"});
    EXPECT_EQ(set, (std::set<std::string>{"md", "rs"}));
}

TEST(FilesystemNameTest, MatchesListedExtensions) {
    const std::set<std::string> listed{"rs", "gz"};
    EXPECT_TRUE(utils::has_listed_extension("src/lib.rs", listed));
    EXPECT_TRUE(utils::has_listed_extension("src/LIB.RS", listed));
    EXPECT_TRUE(utils::has_listed_extension("a.tar.gz", listed));
    EXPECT_FALSE(utils::has_listed_extension("notes.txt", listed));
    EXPECT_FALSE(utils::has_listed_extension("Makefile", listed));
    EXPECT_FALSE(utils::has_listed_extension("rs", listed));
}
