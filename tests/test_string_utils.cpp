#include <gtest/gtest.h>
#include "crucible/utils/string_utils.hpp"
#include "crucible/utils/hash_utils.hpp"

using crucible::utils::HashUtils;
using crucible::utils::StringUtils;

// ─── StringUtils ───────────────────────────────────────────────

TEST(StringUtilsTest, TrimAndLower) {
    EXPECT_EQ(StringUtils::Trim("  \tabc \r\n"), "abc");
    EXPECT_EQ(StringUtils::Trim(" \n "), "");
    EXPECT_EQ(StringUtils::ToLower("MiXeD"), "mixed");
}

TEST(StringUtilsTest, SplitKeepsEmptyFields) {
    auto fields = StringUtils::Split("a,,b,", ',');
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "");
    EXPECT_EQ(fields[2], "b");
    EXPECT_EQ(fields[3], "");
}

TEST(StringUtilsTest, SplitLinesHandlesCarriageReturns) {
    auto lines = StringUtils::SplitLines("one\r\ntwo\rthree\nfour");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
    EXPECT_EQ(lines[3], "four");
}

TEST(StringUtilsTest, StripAnsiRemovesColorCodes) {
    std::string colored = "\x1b[1m\x1b[32mTests:\x1b[39m\x1b[22m 4 passed, 4 total";
    EXPECT_EQ(StringUtils::StripAnsi(colored), "Tests: 4 passed, 4 total");
    EXPECT_EQ(StringUtils::StripAnsi("\x1b]0;title\x07plain"), "plain");
}

TEST(StringUtilsTest, TruncateAppendsEllipsis) {
    EXPECT_EQ(StringUtils::Truncate("abcdefgh", 5), "ab...");
    EXPECT_EQ(StringUtils::Truncate("abc", 5), "abc");
    EXPECT_EQ(StringUtils::Truncate("abcdefgh", 4, ""), "abcd");
}

TEST(StringUtilsTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(StringUtils::ShellQuote("plain"), "'plain'");
    EXPECT_EQ(StringUtils::ShellQuote("it's"), "'it'\\''s'");
}

TEST(StringUtilsTest, ContainsIgnoreCase) {
    EXPECT_TRUE(StringUtils::ContainsIgnoreCase("OrderServiceTest.csproj", "test"));
    EXPECT_FALSE(StringUtils::ContainsIgnoreCase("Orders.csproj", "test"));
}

// ─── HashUtils ─────────────────────────────────────────────────

TEST(HashUtilsTest, Sha256OfKnownInput) {
    EXPECT_EQ(HashUtils::ComputeStringHash(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(HashUtils::ComputeStringHash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, BinaryToHexPadsBytes) {
    const unsigned char bytes[] = {0x00, 0x0f, 0xa0, 0xff};
    EXPECT_EQ(HashUtils::BinaryToHex(bytes, sizeof(bytes)), "000fa0ff");
    EXPECT_EQ(HashUtils::ComputeStringHash("x").size(), 64u);
}

TEST(HashUtilsTest, ShortIdIsStablePrefix) {
    std::string id = HashUtils::ShortId("https://github.com/acme/orders.git", 12);
    EXPECT_EQ(id.size(), 12u);
    EXPECT_EQ(id, HashUtils::ComputeStringHash("https://github.com/acme/orders.git").substr(0, 12));
}
