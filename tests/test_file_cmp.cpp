#include <gtest/gtest.h>

#include <unistd.h>

#include <string>

#include "error.hh"
#include "file_cmp.hh"
#include "tree_fixture.hh"

class FileCmpTest : public TreeFixture {};

TEST_F(FileCmpTest, IdenticalFilesAreEqual) {
    const auto a = writeFile("a.txt", "AAAAAAAAAA");
    const auto b = writeFile("b.txt", "AAAAAAAAAA");

    EXPECT_TRUE(fscmp::bytes_equal(a, b));
}

TEST_F(FileCmpTest, SameSizeDifferentContent) {
    const auto a = writeFile("a.txt", "AAAA");
    const auto b = writeFile("b.txt", "BBBB");

    EXPECT_FALSE(fscmp::bytes_equal(a, b));
}

TEST_F(FileCmpTest, DifferenceInLastChunk) {
    std::string content(1000, 'x');
    const auto a = writeFile("a.txt", content);
    content.back() = 'y';
    const auto b = writeFile("b.txt", content);

    EXPECT_FALSE(fscmp::bytes_equal(a, b, 64));
}

TEST_F(FileCmpTest, ChunkMultipleSizes) {
    const std::string content(256, 'z');
    const auto a = writeFile("a.txt", content);
    const auto b = writeFile("b.txt", content);

    EXPECT_TRUE(fscmp::bytes_equal(a, b, 64));
    EXPECT_TRUE(fscmp::bytes_equal(a, b, 1));
}

TEST_F(FileCmpTest, EmptyFilesAreEqual) {
    const auto a = writeFile("a.txt", "");
    const auto b = writeFile("b.txt", "");

    EXPECT_TRUE(fscmp::bytes_equal(a, b));
}

TEST_F(FileCmpTest, SizeMismatchShortCircuits) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permissions are not enforced for root";
    }
    const auto a = writeFile("a.txt", "AAAA");
    const auto b = writeFile("b.txt", "AAAAA");
    // unreadable content must not matter once sizes differ
    fs::permissions(a, fs::perms::none);

    EXPECT_FALSE(fscmp::bytes_equal(a, b));
    fs::permissions(a, fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(FileCmpTest, MissingFileThrowsReadError) {
    const auto a = writeFile("a.txt", "AAAA");

    EXPECT_THROW(fscmp::bytes_equal(a, test_dir / "missing"), fscmp::read_error_t);
}

TEST_F(FileCmpTest, StaleEntryThrowsReadError) {
    const auto a = writeFile("a.txt", "AAAA");
    const auto b = writeFile("b.txt", "AAAA");
    const fscmp::file_entry_t entry_a("a.txt", a, 4);
    const fscmp::file_entry_t entry_b("b.txt", b, 4);
    writeFile("b.txt", "AAAAAAAA");

    EXPECT_THROW(fscmp::bytes_equal(entry_a, entry_b), fscmp::read_error_t);
}

TEST_F(FileCmpTest, ScannedEntriesCompare) {
    const auto a = writeFile("a.txt", "same");
    const auto b = writeFile("b.txt", "same");

    EXPECT_TRUE(fscmp::bytes_equal(fscmp::file_entry_t("a.txt", a, 4),
                                   fscmp::file_entry_t("b.txt", b, 4)));
}
