#pragma once

#include "source_pos.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace quickpack {

// One mapping of a regular source map. Positions are 0-based.
struct SourceMapToken {
    uint32_t dst_line = 0;
    uint32_t dst_col = 0;
    uint32_t src_line = 0;
    uint32_t src_col = 0;
    std::optional<uint32_t> src_id;
    std::optional<uint32_t> name_id;

    bool operator==(const SourceMapToken&) const = default;
};

struct RegularSourceMap {
    std::optional<std::string> file;
    std::vector<std::string> sources;
    std::vector<std::optional<std::string>> sources_content;
    std::vector<std::string> names;
    std::vector<SourceMapToken> tokens;  // Ordered by generated position

    // Base64 VLQ "mappings" field
    [[nodiscard]] std::string encode_mappings() const;
};

class SourceMap;

struct SourceMapSection {
    SourcePos offset;
    std::shared_ptr<const SourceMap> map;
};

// A v3 source map, either regular or sectioned ("index map").
class SourceMap {
public:
    [[nodiscard]] static std::shared_ptr<const SourceMap> new_regular(RegularSourceMap map);

    // Nested sectioned maps are flattened: the v3 format does not allow a
    // section's map to be an index map itself.
    [[nodiscard]] static std::shared_ptr<const SourceMap> new_sectioned(
        std::vector<SourceMapSection> sections);

    [[nodiscard]] bool is_sectioned() const noexcept {
        return std::holds_alternative<std::vector<SourceMapSection>>(repr_);
    }

    // nullptr for sectioned maps
    [[nodiscard]] const RegularSourceMap* regular() const noexcept {
        return std::get_if<RegularSourceMap>(&repr_);
    }

    // Empty for regular maps
    [[nodiscard]] const std::vector<SourceMapSection>& sections() const noexcept;

    [[nodiscard]] nlohmann::json to_json() const;
    [[nodiscard]] std::string to_string() const { return to_json().dump(); }

private:
    explicit SourceMap(std::variant<RegularSourceMap, std::vector<SourceMapSection>> repr)
        : repr_(std::move(repr)) {}

    std::variant<RegularSourceMap, std::vector<SourceMapSection>> repr_;
};

// Anything able to produce a source map for the bytes it describes
class GenerateSourceMap {
public:
    virtual ~GenerateSourceMap() = default;

    [[nodiscard]] virtual std::shared_ptr<const SourceMap> generate_source_map() const = 0;
};

// An already generated map
class StaticSourceMap final : public GenerateSourceMap {
public:
    explicit StaticSourceMap(std::shared_ptr<const SourceMap> map) : map_(std::move(map)) {}

    [[nodiscard]] std::shared_ptr<const SourceMap> generate_source_map() const override {
        return map_;
    }

private:
    std::shared_ptr<const SourceMap> map_;
};

// Builds a regular map one token at a time, interning sources and names
class SourceMapBuilder {
public:
    explicit SourceMapBuilder(std::optional<std::string> file = std::nullopt);

    uint32_t add_source(std::string_view source);
    void set_source_contents(uint32_t src_id, std::string contents);
    uint32_t add_name(std::string_view name);

    void add(uint32_t dst_line, uint32_t dst_col, uint32_t src_line, uint32_t src_col,
             std::optional<std::string_view> source, std::optional<std::string_view> name);

    [[nodiscard]] size_t token_count() const noexcept { return map_.tokens.size(); }

    [[nodiscard]] RegularSourceMap build();

private:
    RegularSourceMap map_;
    std::unordered_map<std::string, uint32_t> source_ids_;
    std::unordered_map<std::string, uint32_t> name_ids_;
};

// A map without sources and a single mapping at 0:0. Placed at the start of
// synthetic code to end the attribution of the preceding original section.
[[nodiscard]] std::shared_ptr<const SourceMap> empty_map();

// Appends the Base64 VLQ encoding of value
void encode_vlq(std::string& out, int64_t value);

}  // namespace quickpack
