#pragma once

#include "js_ast.hpp"
#include "source_map.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace quickpack::js {

// Rendered module bytes and the module's own regular source map
struct ModuleCode {
    std::string code;
    std::shared_ptr<const SourceMap> map;
};

// Prints program, which was scanned from source, and maps the output back to
// source_name. Mappings are emitted at the start of every original line and
// at every node that kept its span; synthesized nodes are unmapped.
[[nodiscard]] ModuleCode emit_module(const Program& program, std::string_view source,
                                     const std::string& source_name);

// Prints a single expression without mappings
[[nodiscard]] std::string print_expr(const Expr& expr);

// Escapes value for a string literal delimited by quote
[[nodiscard]] std::string escape_string(std::string_view value, char quote);

}  // namespace quickpack::js
