#include "pattern_mapping.hpp"
#include "chunk.hpp"
#include "module_asset.hpp"

#include <stdexcept>

namespace quickpack {

namespace {

PatternMapping map_module(const ChunkingContext& chunking, const EcmascriptModuleAsset& module,
                          ResolveType type) {
    if (type == ResolveType::EsmAsync) {
        // Both placements go through the loader; only what it loads differs
        return PatternMapping::internal(chunking.async_loader_id(module));
    }
    return PatternMapping::internal(chunking.module_id(module));
}

}  // namespace

PatternMapping PatternMapping::resolve_request(const ChunkingContext& chunking,
                                               const ResolveResult& result, ResolveType type) {
    switch (result.kind()) {
        case ResolveResult::Kind::Single:
        case ResolveResult::Kind::Alternatives:
            return map_module(chunking, *result.modules().front(), type);
        case ResolveResult::Kind::External:
            return external(result.specifier());
        case ResolveResult::Kind::Unresolvable:
            return invalid();
    }
    return invalid();
}

js::Expr PatternMapping::apply(js::Expr expr) const {
    if (kind_ == Kind::Invalid) {
        throw std::logic_error("apply called on an invalid pattern mapping");
    }
    char quote = '"';
    if (const auto* str = std::get_if<js::Str>(&expr.node); str && str->quote != '`') {
        quote = str->quote;
    }
    return js::Expr{js::Str{value_, quote}, expr.span};
}

js::Expr PatternMapping::create() const {
    if (kind_ == Kind::Invalid) {
        throw std::logic_error("create called on an invalid pattern mapping");
    }
    return js::make_str(value_);
}

const char* resolve_type_name(ResolveType type) {
    switch (type) {
        case ResolveType::EsmStatic: return "esm";
        case ResolveType::EsmAsync: return "esm async";
        case ResolveType::Cjs: return "cjs";
    }
    return "unknown";
}

}  // namespace quickpack
