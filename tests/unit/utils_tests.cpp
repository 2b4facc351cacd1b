/**
 * Unit tests for utils.hpp and color.hpp
 */

#include <argroute/color.hpp>
#include <argroute/utils.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace argroute;

TEST(UtilsTest, LevenshteinDistance) {
    EXPECT_EQ(utils::levenshteinDistance("", "abc"), 3u);
    EXPECT_EQ(utils::levenshteinDistance("build", "build"), 0u);
    EXPECT_EQ(utils::levenshteinDistance("kitten", "sitting"), 3u);
    EXPECT_EQ(utils::levenshteinDistance("sitting", "kitten"), 3u);
}

TEST(UtilsTest, SuggestClosestFirst) {
    const std::vector<std::string> names{"install", "uninstall", "init", "list"};
    const auto out = utils::suggest("instal", names);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front(), "install");
    EXPECT_TRUE(utils::suggest("zzzzzz", names).empty());
}

TEST(UtilsTest, SuggestIgnoresDashCount) {
    const std::vector<std::string> spellings{"-v", "--verbose", "--version"};
    const auto out = utils::suggest("-verbose", spellings);
    ASSERT_FALSE(out.empty());
    EXPECT_EQ(out.front(), "--verbose");
}

TEST(UtilsTest, Join) {
    EXPECT_EQ(utils::join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(utils::join({}, ", "), "");
}

TEST(ColorTest, ExplicitModesIgnoreTerminal) {
    EXPECT_TRUE(color::enabled(ColorMode::Always, color::Stream::Other));
    EXPECT_FALSE(color::enabled(ColorMode::Never, color::Stream::Stderr));
    EXPECT_FALSE(color::enabled(ColorMode::Auto, color::Stream::Other));
    EXPECT_EQ(color::error("Error:"), "\x1b[1m\x1b[31mError:\x1b[0m");
}

TEST(ColorTest, InjectedStreamIsNeverATerminal) {
    EXPECT_FALSE(color::isTty(color::Stream::Other));
}
