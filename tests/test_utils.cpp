#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(ShellQuote, SafeWordsUnchanged) {
    EXPECT_EQ(shell_quote("abc"), "abc");
    EXPECT_EQ(shell_quote("/opt/app-1.2/run_me.sh"), "/opt/app-1.2/run_me.sh");
    EXPECT_EQ(shell_quote("--key=value"), "--key=value");
}

TEST(ShellQuote, QuotesEverythingElse) {
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("two words"), "'two words'");
    EXPECT_EQ(shell_quote("$HOME"), "'$HOME'");
    EXPECT_EQ(shell_quote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(shell_quote("a;rm -rf /"), "'a;rm -rf /'");
}

TEST(ShellQuote, JoinQuotesEachWord) {
    EXPECT_EQ(shell_join({"echo", "a b", "c"}), "echo 'a b' c");
    EXPECT_EQ(shell_join({}), "");
}

TEST(ParseSize, Suffixes) {
    EXPECT_EQ(parse_size("512", 0), 512);
    EXPECT_EQ(parse_size("4K", 0), 4096);
    EXPECT_EQ(parse_size("10m", 0), 10 * 1024 * 1024);
    EXPECT_EQ(parse_size("1G", 0), 1024LL * 1024 * 1024);
    EXPECT_EQ(parse_size("lots", 7), 7);
    EXPECT_EQ(parse_size("-3K", 7), 7);
    EXPECT_EQ(parse_size("", 7), 7);
}

TEST(HumanSize, Units) {
    EXPECT_EQ(human_size(17), "17B");
    EXPECT_EQ(human_size(2048), "2.0KB");
    EXPECT_EQ(human_size(5 * 1024 * 1024 + 512 * 1024), "5.5MB");
}

TEST(SplitLines, HandlesLineEndings) {
    EXPECT_EQ(split_lines("a\nb\r\nc"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(split_lines("x\n"), std::vector<std::string>{"x"});
    EXPECT_TRUE(split_lines("").empty());
}

TEST(ILess, CaseInsensitiveOrder) {
    EXPECT_TRUE(iless("apple", "Banana"));
    EXPECT_FALSE(iless("Banana", "apple"));
    EXPECT_FALSE(iless("same", "SAME"));
}

TEST(SafeStoi, Fallback) {
    EXPECT_EQ(safe_stoi("42", 0), 42);
    EXPECT_EQ(safe_stoi("x", -1), -1);
}
