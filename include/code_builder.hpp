#pragma once

#include "source_map.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace quickpack {

using SourceMapRef = std::shared_ptr<const GenerateSourceMap>;

// Code stores combined output code and the source map of that output code.
//
// Original fragments carry an optional map; synthetic fragments carry none.
// Each marker records the byte offset where a section starts and the map
// that applies from there on. An absent map marks synthetic code following
// original code. One Code is built by exactly one rendering pass.
class Code final : public GenerateSourceMap {
public:
    using Mapping = std::pair<size_t, SourceMapRef>;

    Code() = default;

    [[nodiscard]] const std::string& source_code() const noexcept { return code_; }
    [[nodiscard]] const std::vector<Mapping>& mappings() const noexcept { return mappings_; }

    // Pushes synthetic runtime code without an associated source map
    void push_bytes(std::string_view code);

    // Pushes original user code with an optional source map. Without a map this
    // is no different than pushing synthetic code.
    void push_source(std::string_view code, SourceMapRef map);

    // Copies the synthetic and original code of an already built Code
    void push_code(const Code& prebuilt);

    // Tests if any code in this builder has an associated source map
    [[nodiscard]] bool has_source_map() const noexcept { return !mappings_.empty(); }

    // Generates a sectioned map with one section per marker. A section's map
    // applies from its offset until the next section's offset.
    [[nodiscard]] std::shared_ptr<const SourceMap> generate_source_map() const override;

    Code& operator+=(std::string_view code) {
        push_bytes(code);
        return *this;
    }

private:
    void push_map(SourceMapRef map);

    std::string code_;
    std::vector<Mapping> mappings_;
};

}  // namespace quickpack
