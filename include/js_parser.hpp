#pragma once

#include "js_ast.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace quickpack::js {

// Scans an ECMAScript module into a Program.
//
// Only what bundling needs is structured: import and export declarations,
// `import(...)` and `require(...)` calls with their argument expressions.
// Everything else stays RawText. Strings, template literals, comments and
// regular expression literals are skipped, so imports mentioned inside them
// are not picked up. Never fails: unrecognized constructs remain text.
[[nodiscard]] Program parse_module(std::string_view source);

// Parses one expression from the small grammar used for call arguments.
// nullopt if the text is not entirely such an expression.
[[nodiscard]] std::optional<Expr> parse_expression(std::string_view source);

// Decodes the body of a string literal (without quotes)
[[nodiscard]] std::string decode_string(std::string_view body);

}  // namespace quickpack::js
