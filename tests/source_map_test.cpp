#include "source_map.hpp"

#include <gtest/gtest.h>

using namespace quickpack;

namespace {

std::string vlq(int64_t value) {
    std::string out;
    encode_vlq(out, value);
    return out;
}

}  // namespace

TEST(SourceMapTest, VlqKnownValues) {
    EXPECT_EQ(vlq(0), "A");
    EXPECT_EQ(vlq(1), "C");
    EXPECT_EQ(vlq(-1), "D");
    EXPECT_EQ(vlq(15), "e");
    EXPECT_EQ(vlq(16), "gB");
    EXPECT_EQ(vlq(-16), "hB");
    EXPECT_EQ(vlq(123), "2H");
}

TEST(SourceMapTest, RegularMapJson) {
    SourceMapBuilder builder("out.js");
    builder.add(0, 0, 0, 0, "a.js", std::nullopt);
    builder.add(0, 4, 0, 4, "a.js", "foo");
    builder.add(2, 2, 1, 0, "a.js", std::nullopt);
    builder.set_source_contents(0, "var foo;\nbar");

    auto map = SourceMap::new_regular(builder.build());
    auto json = map->to_json();

    EXPECT_EQ(json["version"], 3);
    EXPECT_EQ(json["file"], "out.js");
    EXPECT_EQ(json["sources"], nlohmann::json::array({"a.js"}));
    EXPECT_EQ(json["sourcesContent"], nlohmann::json::array({"var foo;\nbar"}));
    EXPECT_EQ(json["names"], nlohmann::json::array({"foo"}));
    EXPECT_EQ(json["mappings"], "AAAA,IAAIA;;EACJ");
}

TEST(SourceMapTest, BuilderSortsTokensAndInternsSources) {
    SourceMapBuilder builder;
    builder.add(1, 0, 0, 0, "b.js", std::nullopt);
    builder.add(0, 0, 0, 0, "a.js", std::nullopt);
    builder.add(0, 3, 0, 3, "b.js", std::nullopt);
    auto map = builder.build();

    ASSERT_EQ(map.sources.size(), 2u);
    EXPECT_EQ(map.sources[0], "b.js");
    ASSERT_EQ(map.tokens.size(), 3u);
    EXPECT_EQ(map.tokens[0].dst_line, 0u);
    EXPECT_EQ(map.tokens[0].dst_col, 0u);
    EXPECT_EQ(map.tokens[1].dst_col, 3u);
    EXPECT_EQ(map.tokens[2].dst_line, 1u);
    EXPECT_FALSE(map.tokens[0].name_id.has_value());
}

TEST(SourceMapTest, EmptyMapHasSingleUnsourcedMapping) {
    auto json = empty_map()->to_json();
    EXPECT_EQ(json["sources"], nlohmann::json::array());
    EXPECT_EQ(json["mappings"], "A");
    EXPECT_FALSE(json.contains("sourcesContent"));
}

TEST(SourceMapTest, SectionedMapJson) {
    auto inner = SourceMap::new_regular([] {
        SourceMapBuilder builder;
        builder.add(0, 0, 0, 0, "m.js", std::nullopt);
        return builder.build();
    }());

    auto map = SourceMap::new_sectioned({{SourcePos{0, 0}, inner}, {SourcePos{3, 7}, empty_map()}});
    auto json = map->to_json();

    EXPECT_EQ(json["version"], 3);
    ASSERT_EQ(json["sections"].size(), 2u);
    EXPECT_EQ(json["sections"][1]["offset"]["line"], 3);
    EXPECT_EQ(json["sections"][1]["offset"]["column"], 7);
    EXPECT_EQ(json["sections"][0]["map"]["sources"], nlohmann::json::array({"m.js"}));
    EXPECT_FALSE(json.contains("mappings"));
}

TEST(SourceMapTest, NestedSectionsAreFlattened) {
    auto leaf = empty_map();
    auto nested = SourceMap::new_sectioned({{SourcePos{0, 2}, leaf}, {SourcePos{1, 4}, leaf}});
    auto outer = SourceMap::new_sectioned({{SourcePos{5, 3}, nested}});

    const auto& sections = outer->sections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0].offset, (SourcePos{5, 5}));
    EXPECT_EQ(sections[1].offset, (SourcePos{6, 4}));
    EXPECT_FALSE(sections[0].map->is_sectioned());
}
