#include "source_map.hpp"

#include <algorithm>

namespace quickpack {

namespace {

constexpr char kBase64Chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

const std::vector<SourceMapSection> kNoSections;

SourcePos add_offset(SourcePos base, SourcePos relative) {
    if (relative.line == 0) {
        return SourcePos{base.line, base.column + relative.column};
    }
    return SourcePos{base.line + relative.line, relative.column};
}

void flatten_into(std::vector<SourceMapSection>& out, SourcePos base,
                  const std::shared_ptr<const SourceMap>& map) {
    if (!map->is_sectioned()) {
        out.push_back({base, map});
        return;
    }
    for (const auto& section : map->sections()) {
        flatten_into(out, add_offset(base, section.offset), section.map);
    }
}

}  // namespace

void encode_vlq(std::string& out, int64_t value) {
    uint64_t vlq = value < 0 ? ((static_cast<uint64_t>(-value) << 1) | 1)
                             : (static_cast<uint64_t>(value) << 1);
    do {
        uint32_t digit = static_cast<uint32_t>(vlq & 0x1f);
        vlq >>= 5;
        if (vlq > 0) {
            digit |= 0x20;  // continuation bit
        }
        out += kBase64Chars[digit];
    } while (vlq > 0);
}

std::string RegularSourceMap::encode_mappings() const {
    std::string out;

    uint32_t line = 0;
    int64_t prev_dst_col = 0;
    int64_t prev_src_id = 0;
    int64_t prev_src_line = 0;
    int64_t prev_src_col = 0;
    int64_t prev_name_id = 0;
    bool first_in_line = true;

    for (const auto& token : tokens) {
        while (line < token.dst_line) {
            out += ';';
            ++line;
            prev_dst_col = 0;
            first_in_line = true;
        }
        if (!first_in_line) {
            out += ',';
        }
        first_in_line = false;

        encode_vlq(out, static_cast<int64_t>(token.dst_col) - prev_dst_col);
        prev_dst_col = token.dst_col;

        if (!token.src_id) {
            continue;
        }
        encode_vlq(out, static_cast<int64_t>(*token.src_id) - prev_src_id);
        prev_src_id = *token.src_id;
        encode_vlq(out, static_cast<int64_t>(token.src_line) - prev_src_line);
        prev_src_line = token.src_line;
        encode_vlq(out, static_cast<int64_t>(token.src_col) - prev_src_col);
        prev_src_col = token.src_col;

        if (token.name_id) {
            encode_vlq(out, static_cast<int64_t>(*token.name_id) - prev_name_id);
            prev_name_id = *token.name_id;
        }
    }

    return out;
}

// ============================================================================
// SourceMap
// ============================================================================

std::shared_ptr<const SourceMap> SourceMap::new_regular(RegularSourceMap map) {
    return std::shared_ptr<const SourceMap>(new SourceMap(std::move(map)));
}

std::shared_ptr<const SourceMap> SourceMap::new_sectioned(std::vector<SourceMapSection> sections) {
    std::vector<SourceMapSection> flat;
    flat.reserve(sections.size());
    for (auto& section : sections) {
        flatten_into(flat, section.offset, section.map);
    }
    return std::shared_ptr<const SourceMap>(new SourceMap(std::move(flat)));
}

const std::vector<SourceMapSection>& SourceMap::sections() const noexcept {
    if (const auto* sections = std::get_if<std::vector<SourceMapSection>>(&repr_)) {
        return *sections;
    }
    return kNoSections;
}

nlohmann::json SourceMap::to_json() const {
    nlohmann::json json;
    json["version"] = 3;

    if (const auto* map = regular()) {
        if (map->file) {
            json["file"] = *map->file;
        }
        json["sources"] = map->sources;

        bool has_content = std::any_of(map->sources_content.begin(), map->sources_content.end(),
                                       [](const auto& content) { return content.has_value(); });
        if (has_content) {
            nlohmann::json contents = nlohmann::json::array();
            for (const auto& content : map->sources_content) {
                contents.push_back(content ? nlohmann::json(*content) : nlohmann::json(nullptr));
            }
            json["sourcesContent"] = std::move(contents);
        }

        json["names"] = map->names;
        json["mappings"] = map->encode_mappings();
        return json;
    }

    nlohmann::json sections = nlohmann::json::array();
    for (const auto& section : this->sections()) {
        sections.push_back({
            {"offset", {{"line", section.offset.line}, {"column", section.offset.column}}},
            {"map", section.map->to_json()},
        });
    }
    json["sections"] = std::move(sections);
    return json;
}

// ============================================================================
// SourceMapBuilder
// ============================================================================

SourceMapBuilder::SourceMapBuilder(std::optional<std::string> file) {
    map_.file = std::move(file);
}

uint32_t SourceMapBuilder::add_source(std::string_view source) {
    auto [it, inserted] = source_ids_.try_emplace(std::string(source),
                                                  static_cast<uint32_t>(map_.sources.size()));
    if (inserted) {
        map_.sources.emplace_back(source);
        map_.sources_content.emplace_back(std::nullopt);
    }
    return it->second;
}

void SourceMapBuilder::set_source_contents(uint32_t src_id, std::string contents) {
    if (src_id < map_.sources_content.size()) {
        map_.sources_content[src_id] = std::move(contents);
    }
}

uint32_t SourceMapBuilder::add_name(std::string_view name) {
    auto [it, inserted] = name_ids_.try_emplace(std::string(name),
                                                static_cast<uint32_t>(map_.names.size()));
    if (inserted) {
        map_.names.emplace_back(name);
    }
    return it->second;
}

void SourceMapBuilder::add(uint32_t dst_line, uint32_t dst_col, uint32_t src_line,
                           uint32_t src_col, std::optional<std::string_view> source,
                           std::optional<std::string_view> name) {
    SourceMapToken token;
    token.dst_line = dst_line;
    token.dst_col = dst_col;
    token.src_line = src_line;
    token.src_col = src_col;
    if (source) {
        token.src_id = add_source(*source);
    }
    if (name) {
        token.name_id = add_name(*name);
    }
    map_.tokens.push_back(token);
}

RegularSourceMap SourceMapBuilder::build() {
    std::stable_sort(map_.tokens.begin(), map_.tokens.end(),
                     [](const SourceMapToken& a, const SourceMapToken& b) {
                         return a.dst_line < b.dst_line ||
                                (a.dst_line == b.dst_line && a.dst_col < b.dst_col);
                     });
    source_ids_.clear();
    name_ids_.clear();
    return std::move(map_);
}

std::shared_ptr<const SourceMap> empty_map() {
    static const std::shared_ptr<const SourceMap> map = [] {
        SourceMapBuilder builder;
        builder.add(0, 0, 0, 0, std::nullopt, std::nullopt);
        return SourceMap::new_regular(builder.build());
    }();
    return map;
}

}  // namespace quickpack
