/**
 * test_string_utils.cpp
 */

#include "utils/StringUtils.hpp"

#include <gtest/gtest.h>

using interlink::utils::StringUtils;

class StringUtilsTest : public ::testing::Test {
};

TEST_F(StringUtilsTest, NormalizeTagsTrimsAndDeduplicates) {
    auto tags = StringUtils::normalizeTags({"  render ", "", "final", "render", "   ", "v2"});
    EXPECT_EQ(tags, (std::vector<std::string>{"render", "final", "v2"}));
}

TEST_F(StringUtilsTest, NormalizeTagsOfEmptyList) {
    EXPECT_TRUE(StringUtils::normalizeTags({}).empty());
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::formatBytes(512), "512 B");
    EXPECT_EQ(StringUtils::formatBytes(1536), "1.5 KB");
    EXPECT_EQ(StringUtils::formatBytes(3LL * 1024 * 1024 * 1024), "3.0 GB");
}

TEST_F(StringUtilsTest, FormatDurationAndPercentage) {
    EXPECT_EQ(StringUtils::formatDuration(std::chrono::seconds(3725)), "01:02:05");
    EXPECT_EQ(StringUtils::formatPercentage(0.256), "25.6%");
}

TEST_F(StringUtilsTest, ParseIntFallsBack) {
    EXPECT_EQ(StringUtils::parseInt("42"), 42);
    EXPECT_EQ(StringUtils::parseInt("abc", 7), 7);
    EXPECT_EQ(StringUtils::parseInt("99999999999999999999", -1), -1);
}

TEST_F(StringUtilsTest, SplitJoinTrim) {
    EXPECT_EQ(StringUtils::split("a,b,c", ','), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(StringUtils::join({"a", "b"}, ", "), "a, b");
    EXPECT_EQ(StringUtils::trim("\t x \n"), "x");
    EXPECT_EQ(StringUtils::toUpper("upload"), "UPLOAD");
}
