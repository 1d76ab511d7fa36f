#include <gtest/gtest.h>
#include <picker/layout.hpp>

TEST(Layout, EmptyStringCostsOneRow) {
    EXPECT_EQ(rows_for("", 80, false), 1);
    EXPECT_EQ(rows_for("", 80, true), 1);
}

TEST(Layout, TruncateIsAlwaysOneRow) {
    EXPECT_EQ(rows_for(std::string(500, 'x'), 10, true), 1);
}

TEST(Layout, WrapUsesWidthMinusPrefix) {
    // 8 usable columns at width 10
    EXPECT_EQ(rows_for(std::string(8, 'x'), 10, false), 1);
    EXPECT_EQ(rows_for(std::string(9, 'x'), 10, false), 2);
    EXPECT_EQ(rows_for(std::string(16, 'x'), 10, false), 2);
    EXPECT_EQ(rows_for(std::string(17, 'x'), 10, false), 3);
}

TEST(Layout, DegenerateWidthClampsToOneRow) {
    EXPECT_EQ(rows_for("hello", 2, false), 1);
    EXPECT_EQ(rows_for("hello", 0, false), 1);
    EXPECT_EQ(rows_for("hello", -5, false), 1);
}

// ── Truncation ──────────────────────────────────────────────

TEST(Layout, TruncateLongStringWithEllipsis) {
    std::string s(20, 'a');
    s[0] = 'b';
    std::string out = truncate_to_width(s, 10);
    EXPECT_EQ(out, "baaaa...");
    EXPECT_EQ(out.size(), 8u);
}

TEST(Layout, TruncateLeavesShortStrings) {
    EXPECT_EQ(truncate_to_width("12345678", 10), "12345678");
    EXPECT_EQ(truncate_to_width("", 10), "");
}

TEST(Layout, TruncateSkippedWhenTooNarrowForEllipsis) {
    EXPECT_EQ(truncate_to_width("abcdefgh", 5), "abcdefgh");
}
