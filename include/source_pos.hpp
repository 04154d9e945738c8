#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace quickpack {

// 0-based line/column position in generated output. Columns count bytes.
// Advanced incrementally so callers walking a buffer in order never rescan.
struct SourcePos {
    uint32_t line = 0;
    uint32_t column = 0;

    // Advances past bytes, which must directly follow the current position
    void update(std::string_view bytes) noexcept;

    // Position reached after the whole of bytes, starting from 0:0
    [[nodiscard]] static SourcePos from_bytes(std::string_view bytes) noexcept;

    bool operator==(const SourcePos&) const = default;
    [[nodiscard]] bool operator<(const SourcePos& other) const noexcept {
        return line < other.line || (line == other.line && column < other.column);
    }
};

}  // namespace quickpack
