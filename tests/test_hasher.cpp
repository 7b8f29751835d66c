#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "error.hh"
#include "hasher.hh"
#include "tree_fixture.hh"

class HasherTest : public TreeFixture {
protected:
    static fscmp::config_t makeConfig(const std::string& algo, uint64_t buf_sz) {
        fscmp::config_t cfg;
        cfg.hash_algo = algo;
        cfg.buf_sz = buf_sz;
        return cfg;
    }
};

TEST_F(HasherTest, Blake2bKnownVector) {
    const auto path = writeFile("abc.txt", "abc");
    const fscmp::checksum_t checksum(fscmp::config_t{});

    EXPECT_EQ(checksum.checksum(path),
              "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
              "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923");
}

TEST_F(HasherTest, Sha256KnownVectors) {
    const auto abc = writeFile("abc.txt", "abc");
    const auto empty = writeFile("empty.txt", "");
    const fscmp::checksum_t checksum(makeConfig("SHA256", 1024));

    EXPECT_EQ(checksum.checksum(abc),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(checksum.checksum(empty),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(HasherTest, DigestIndependentOfBufferSize) {
    std::string content;
    for (int i = 0; i < 10000; ++i) {
        content += static_cast<char>('a' + i % 26);
    }
    const auto path = writeFile("long.txt", content);

    const fscmp::checksum_t small(makeConfig(fscmp::default_hash_algo, 7));
    const fscmp::checksum_t exact(makeConfig(fscmp::default_hash_algo, 10000));
    const fscmp::checksum_t large(makeConfig(fscmp::default_hash_algo, 1 << 20));

    EXPECT_EQ(small.checksum(path), large.checksum(path));
    EXPECT_EQ(exact.checksum(path), large.checksum(path));
}

TEST_F(HasherTest, DifferentContentDifferentDigest) {
    const auto a = writeFile("a.txt", "AAAA");
    const auto b = writeFile("b.txt", "AAAB");
    const fscmp::checksum_t checksum(fscmp::config_t{});

    EXPECT_NE(checksum.checksum(a), checksum.checksum(b));
}

TEST_F(HasherTest, MissingFileThrowsReadError) {
    const fscmp::checksum_t checksum(fscmp::config_t{});

    EXPECT_THROW(checksum.checksum(test_dir / "missing"), fscmp::read_error_t);
}

TEST_F(HasherTest, StaleEntryThrowsReadError) {
    const auto path = writeFile("grow.txt", "1234");
    const fscmp::file_entry_t entry("grow.txt", path, 4);
    writeFile("grow.txt", "123456");
    const fscmp::checksum_t checksum(fscmp::config_t{});

    EXPECT_THROW(checksum.checksum(entry), fscmp::read_error_t);
}

TEST_F(HasherTest, CountsHashedFiles) {
    const auto path = writeFile("a.txt", "a");
    const fscmp::checksum_t checksum(fscmp::config_t{});

    EXPECT_EQ(checksum.hashed_count(), 0u);
    checksum.checksum(path);
    checksum.checksum(fscmp::file_entry_t("a.txt", path, 1));
    EXPECT_EQ(checksum.hashed_count(), 2u);
}

TEST(HasherConfigTest, UnknownAlgorithmThrows) {
    fscmp::config_t cfg;
    cfg.hash_algo = "no-such-digest";

    EXPECT_THROW(fscmp::checksum_t{cfg}, std::invalid_argument);
}

TEST(HasherConfigTest, ZeroBufferThrows) {
    fscmp::config_t cfg;
    cfg.buf_sz = 0;

    EXPECT_THROW(fscmp::checksum_t{cfg}, std::invalid_argument);
}

TEST(HasherConfigTest, HasherResetStartsOver) {
    fscmp::hasher_t hasher(fscmp::find_digest("SHA256"));
    hasher.update("garbage", 7);
    hasher.reset();
    hasher.update("abc", 3);

    EXPECT_EQ(hasher.digest(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
