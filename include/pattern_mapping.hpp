#pragma once

#include "asset.hpp"
#include "js_ast.hpp"

#include <cstdint>
#include <string>

namespace quickpack {

class ChunkingContext;

// How a reference asks for its target
enum class ResolveType : uint8_t {
    EsmStatic,  // import declaration or re-export
    EsmAsync,   // import()
    Cjs,        // require()
};

// What a reference's specifier becomes in generated code
class PatternMapping {
public:
    enum class Kind : uint8_t {
        Invalid,   // Unresolvable: generated code fails at runtime
        Internal,  // A module id inside the bundle
        External,  // A specifier left for the host to load
    };

    [[nodiscard]] static PatternMapping invalid() { return PatternMapping(Kind::Invalid, {}); }
    [[nodiscard]] static PatternMapping internal(std::string id) {
        return PatternMapping(Kind::Internal, std::move(id));
    }
    [[nodiscard]] static PatternMapping external(std::string specifier) {
        return PatternMapping(Kind::External, std::move(specifier));
    }

    // Combines a resolve outcome with the chunking context. Total: every
    // outcome maps to exactly one variant, unresolvable to Invalid.
    [[nodiscard]] static PatternMapping resolve_request(const ChunkingContext& chunking,
                                                        const ResolveResult& result,
                                                        ResolveType type);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_invalid() const noexcept { return kind_ == Kind::Invalid; }
    [[nodiscard]] bool is_internal_import() const noexcept { return kind_ == Kind::Internal; }

    // Module id or external specifier
    [[nodiscard]] const std::string& value() const noexcept { return value_; }

    // Replaces the specifier expression expr, keeping its span.
    // Throws std::logic_error on Invalid.
    [[nodiscard]] js::Expr apply(js::Expr expr) const;

    // A new specifier expression without a span. Throws std::logic_error on Invalid.
    [[nodiscard]] js::Expr create() const;

    bool operator==(const PatternMapping&) const = default;

private:
    PatternMapping(Kind kind, std::string value) : kind_(kind), value_(std::move(value)) {}

    Kind kind_;
    std::string value_;
};

[[nodiscard]] const char* resolve_type_name(ResolveType type);

}  // namespace quickpack
