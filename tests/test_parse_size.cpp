#include <gtest/gtest.h>

#include <stdexcept>

#include "parse_size.hh"

TEST(ParseSizeTest, PlainBytes) {
    EXPECT_EQ(utils::parse_size("0"), 0u);
    EXPECT_EQ(utils::parse_size("4096"), 4096u);
    EXPECT_EQ(utils::parse_size("10B"), 10u);
}

TEST(ParseSizeTest, DecimalAndBinaryUnits) {
    EXPECT_EQ(utils::parse_size("4K"), 4000u);
    EXPECT_EQ(utils::parse_size("4kB"), 4000u);
    EXPECT_EQ(utils::parse_size("4KiB"), 4096u);
    EXPECT_EQ(utils::parse_size("1MiB"), 1048576u);
    EXPECT_EQ(utils::parse_size("2GB"), 2000000000u);
    EXPECT_EQ(utils::parse_size("1TiB"), 1099511627776u);
}

TEST(ParseSizeTest, Bits) {
    EXPECT_EQ(utils::parse_size("80b"), 10u);
    EXPECT_EQ(utils::parse_size("8Kb"), 1000u);
}

TEST(ParseSizeTest, RejectsMalformed) {
    EXPECT_THROW(utils::parse_size(""), std::invalid_argument);
    EXPECT_THROW(utils::parse_size("KB"), std::invalid_argument);
    EXPECT_THROW(utils::parse_size("-1"), std::invalid_argument);
    EXPECT_THROW(utils::parse_size("12X"), std::invalid_argument);
    EXPECT_THROW(utils::parse_size("4KiBs"), std::invalid_argument);
    EXPECT_THROW(utils::parse_size("4i"), std::invalid_argument);
    EXPECT_THROW(utils::parse_size("1 MB"), std::invalid_argument);
}

TEST(ParseSizeTest, RejectsOverflow) {
    EXPECT_THROW(utils::parse_size("99999999999999999999999"), std::invalid_argument);
    EXPECT_THROW(utils::parse_size("100000EiB"), std::invalid_argument);
}

TEST(FormatSizeTest, HumanReadable) {
    EXPECT_EQ(utils::format_size(0), "0 B");
    EXPECT_EQ(utils::format_size(1023), "1023 B");
    EXPECT_EQ(utils::format_size(1024), "1.0 KB");
    EXPECT_EQ(utils::format_size(1536), "1.5 KB");
    EXPECT_EQ(utils::format_size(5ULL * 1024 * 1024 * 1024), "5.0 GB");
}
