#include "source_pos.hpp"

#include <gtest/gtest.h>

using quickpack::SourcePos;

TEST(SourcePosTest, CountsColumnsOnFirstLine) {
    auto pos = SourcePos::from_bytes("abc");
    EXPECT_EQ(pos.line, 0u);
    EXPECT_EQ(pos.column, 3u);
}

TEST(SourcePosTest, NewlineResetsColumn) {
    auto pos = SourcePos::from_bytes("a\nbc\n");
    EXPECT_EQ(pos, (SourcePos{2, 0}));

    pos = SourcePos::from_bytes("a\nb");
    EXPECT_EQ(pos, (SourcePos{1, 1}));
}

TEST(SourcePosTest, IncrementalUpdateMatchesWholeBuffer) {
    const std::string_view text = "first\nsecond line\nthird";
    SourcePos pos;
    pos.update(text.substr(0, 3));
    pos.update(text.substr(3, 9));
    pos.update(text.substr(12));
    EXPECT_EQ(pos, SourcePos::from_bytes(text));
}

TEST(SourcePosTest, ColumnsCountBytes) {
    // U+00E9 is two bytes in UTF-8
    auto pos = SourcePos::from_bytes("\xc3\xa9");
    EXPECT_EQ(pos.column, 2u);
}

TEST(SourcePosTest, Ordering) {
    EXPECT_TRUE((SourcePos{0, 5}) < (SourcePos{1, 0}));
    EXPECT_TRUE((SourcePos{1, 0}) < (SourcePos{1, 1}));
    EXPECT_FALSE((SourcePos{1, 1}) < (SourcePos{1, 1}));
}
