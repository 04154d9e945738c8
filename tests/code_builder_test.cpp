#include "code_builder.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace quickpack;

namespace {

SourceMapRef make_map(uint32_t src_line) {
    SourceMapBuilder builder;
    builder.add(0, 0, src_line, 0, "input.js", std::nullopt);
    return std::make_shared<StaticSourceMap>(SourceMap::new_regular(builder.build()));
}

void expect_no_adjacent_empty_markers(const Code& code) {
    const auto& mappings = code.mappings();
    for (size_t i = 1; i < mappings.size(); ++i) {
        EXPECT_FALSE(!mappings[i - 1].second && !mappings[i].second)
            << "adjacent empty markers at " << i;
    }
}

}  // namespace

TEST(CodeBuilderTest, BufferIsConcatenationOfPushes) {
    Code code;
    code.push_bytes("a");
    code.push_source("bc", make_map(0));
    code.push_bytes("");
    code += "d\n";
    code.push_source("e", nullptr);
    EXPECT_EQ(code.source_code(), "abcd\ne");
}

TEST(CodeBuilderTest, HasSourceMap) {
    Code synthetic;
    synthetic.push_bytes("x");
    synthetic.push_bytes("y");
    EXPECT_FALSE(synthetic.has_source_map());

    Code unmapped;
    unmapped.push_source("x", nullptr);
    unmapped.push_source("y", nullptr);
    EXPECT_FALSE(unmapped.has_source_map());

    Code mapped;
    mapped.push_bytes("x");
    mapped.push_source("y", make_map(0));
    EXPECT_TRUE(mapped.has_source_map());
}

TEST(CodeBuilderTest, SyntheticCodeFirstRecordsNoMarker) {
    Code code;
    code.push_bytes("runtime");
    EXPECT_TRUE(code.mappings().empty());
}

TEST(CodeBuilderTest, SyntheticAfterOriginalEndsSection) {
    auto m1 = make_map(0);
    Code code;
    code.push_source("x", m1);
    code.push_bytes("y");
    code.push_bytes("z");

    ASSERT_EQ(code.mappings().size(), 2u);
    EXPECT_EQ(code.mappings()[0], (Code::Mapping{0, m1}));
    EXPECT_EQ(code.mappings()[1], (Code::Mapping{1, nullptr}));
}

TEST(CodeBuilderTest, NoAdjacentEmptyMarkersForRandomSequences) {
    std::mt19937 rng(1234);
    auto map = make_map(0);
    for (int round = 0; round < 50; ++round) {
        Code code;
        Code other;
        other.push_bytes("p");
        other.push_source("q", map);
        other.push_bytes("r");

        std::string expected;
        for (int step = 0; step < 20; ++step) {
            switch (rng() % 4) {
            case 0:
                code.push_bytes("s");
                expected += "s";
                break;
            case 1:
                code.push_source("o", map);
                expected += "o";
                break;
            case 2:
                code.push_source("n", nullptr);
                expected += "n";
                break;
            default:
                code.push_code(other);
                expected += "pqr";
                break;
            }
        }
        EXPECT_EQ(code.source_code(), expected);
        expect_no_adjacent_empty_markers(code);
    }
}

TEST(CodeBuilderTest, PushCodeShiftsMarkers) {
    auto m1 = make_map(0);
    auto m2 = make_map(1);

    Code a;
    a.push_source("x", m1);
    a.push_bytes("y");

    Code b;
    b.push_source("z", m2);

    a.push_code(b);

    EXPECT_EQ(a.source_code(), "xyz");
    ASSERT_EQ(a.mappings().size(), 3u);
    EXPECT_EQ(a.mappings()[0], (Code::Mapping{0, m1}));
    EXPECT_EQ(a.mappings()[1], (Code::Mapping{1, nullptr}));
    EXPECT_EQ(a.mappings()[2], (Code::Mapping{2, m2}));
}

TEST(CodeBuilderTest, PushCodeStartingWithSyntheticEndsOpenSection) {
    auto m1 = make_map(0);
    auto m2 = make_map(1);

    Code a;
    a.push_source("x", m1);

    Code b;
    b.push_bytes("y");
    b.push_source("z", m2);

    a.push_code(b);

    EXPECT_EQ(a.source_code(), "xyz");
    ASSERT_EQ(a.mappings().size(), 3u);
    EXPECT_EQ(a.mappings()[1], (Code::Mapping{1, nullptr}));
    EXPECT_EQ(a.mappings()[2], (Code::Mapping{2, m2}));
}

TEST(CodeBuilderTest, PushCodeWithoutMapsIsSynthetic) {
    auto m1 = make_map(0);
    Code a;
    a.push_source("x", m1);

    Code b;
    b.push_bytes("yz");
    a.push_code(b);

    EXPECT_EQ(a.source_code(), "xyz");
    ASSERT_EQ(a.mappings().size(), 2u);
    EXPECT_EQ(a.mappings()[1], (Code::Mapping{1, nullptr}));
}

TEST(CodeBuilderTest, SectionOffsetsFollowLineCounting) {
    Code code;
    code.push_bytes("a\n");
    code.push_source("b", make_map(0));

    auto map = code.generate_source_map();
    ASSERT_TRUE(map->is_sectioned());
    ASSERT_EQ(map->sections().size(), 1u);
    EXPECT_EQ(map->sections()[0].offset, (SourcePos{1, 0}));
}

TEST(CodeBuilderTest, OneSectionPerMarkerInOrder) {
    Code code;
    code.push_bytes("header\n");
    code.push_source("one\ntwo", make_map(0));
    code.push_bytes(";\n");
    code.push_source("three", make_map(2));
    code.push_bytes("\nfooter");

    auto map = code.generate_source_map();
    const auto& sections = map->sections();
    ASSERT_EQ(sections.size(), code.mappings().size());
    ASSERT_EQ(sections.size(), 4u);

    EXPECT_EQ(sections[0].offset, (SourcePos{1, 0}));
    EXPECT_EQ(sections[1].offset, (SourcePos{2, 3}));
    EXPECT_EQ(sections[2].offset, (SourcePos{3, 0}));
    EXPECT_EQ(sections[3].offset, (SourcePos{3, 5}));

    for (size_t i = 1; i < sections.size(); ++i) {
        EXPECT_FALSE(sections[i].offset < sections[i - 1].offset);
    }

    // Synthetic sections carry the empty map
    EXPECT_EQ(sections[1].map, empty_map());
    EXPECT_EQ(sections[3].map, empty_map());
}

TEST(CodeBuilderTest, SyntheticOnlyCodeHasNoSections) {
    Code code;
    code.push_bytes("a\nb");
    auto map = code.generate_source_map();
    EXPECT_TRUE(map->is_sectioned());
    EXPECT_TRUE(map->sections().empty());
    EXPECT_EQ(map->to_json()["sections"].size(), 0u);
}
