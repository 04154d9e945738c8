#include "source_pos.hpp"

namespace quickpack {

void SourcePos::update(std::string_view bytes) noexcept {
    for (char c : bytes) {
        if (c == '\n') {
            ++line;
            column = 0;
        } else {
            ++column;
        }
    }
}

SourcePos SourcePos::from_bytes(std::string_view bytes) noexcept {
    SourcePos pos;
    pos.update(bytes);
    return pos;
}

}  // namespace quickpack
