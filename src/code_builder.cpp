#include "code_builder.hpp"

#include <cassert>

namespace quickpack {

// Setting breakpoints on synthetic code confuses debuggers that treat the
// location as belonging to the previous original section. An empty map at the
// start of synthetic code tells them the previous section ended there.
void Code::push_map(SourceMapRef map) {
    if (!map && (mappings_.empty() || !mappings_.back().second)) {
        // No reason to push an empty map directly after an empty map
        return;
    }

    assert((map || !mappings_.empty()) && "the first mapping is never empty");
    mappings_.emplace_back(code_.size(), std::move(map));
}

void Code::push_bytes(std::string_view code) {
    push_map(nullptr);
    code_.append(code);
}

void Code::push_source(std::string_view code, SourceMapRef map) {
    push_map(std::move(map));
    code_.append(code);
}

void Code::push_code(const Code& prebuilt) {
    if (!prebuilt.mappings_.empty()) {
        if (prebuilt.mappings_.front().first > 0) {
            // The prebuilt code starts with a synthetic section, which must end
            // whatever section is currently open here.
            push_map(nullptr);
        }

        const size_t len = code_.size();
        mappings_.reserve(mappings_.size() + prebuilt.mappings_.size());
        for (const auto& [index, map] : prebuilt.mappings_) {
            mappings_.emplace_back(index + len, map);
        }
    } else {
        push_map(nullptr);
    }

    code_.append(prebuilt.code_);
}

std::shared_ptr<const SourceMap> Code::generate_source_map() const {
    SourcePos pos;
    size_t last_byte_pos = 0;

    std::vector<SourceMapSection> sections;
    sections.reserve(mappings_.size());

    const std::string_view code(code_);
    for (const auto& [byte_pos, map] : mappings_) {
        pos.update(code.substr(last_byte_pos, byte_pos - last_byte_pos));
        last_byte_pos = byte_pos;

        sections.push_back({pos, map ? map->generate_source_map() : empty_map()});
    }

    return SourceMap::new_sectioned(std::move(sections));
}

}  // namespace quickpack
