#pragma once

#include "asset.hpp"
#include "js_ast.hpp"
#include "js_printer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace quickpack {

class AssetContext;
class ChunkingContext;

// An ECMAScript (or JSON) module over a source asset
class EcmascriptModuleAsset final : public Asset {
public:
    EcmascriptModuleAsset(const AssetContext& context, std::shared_ptr<const Asset> source);

    [[nodiscard]] const std::string& path() const noexcept override { return source_->path(); }
    [[nodiscard]] TaskGraph::Ref<FileContent> content() const override { return source_->content(); }

    // Memoized under module.references
    [[nodiscard]] TaskGraph::Ref<std::vector<ReferenceRef>> references() const override;

    [[nodiscard]] const Asset& source() const noexcept { return *source_; }
    [[nodiscard]] bool is_json() const;
    [[nodiscard]] bool is_remote() const;

    // Location requests in this module are resolved from: the file path, or
    // the URL after redirects.
    [[nodiscard]] std::string origin() const;

    // The AST snapshot reference paths point into. Memoized under module.parse.
    [[nodiscard]] TaskGraph::Ref<js::Program> parse() const;

    // Modules the references resolve to, in reference order without
    // duplicates. External and unresolvable references add nothing.
    [[nodiscard]] TaskGraph::Ref<std::vector<ModuleRef>> referenced_assets() const;

    // Module code with every reference and local export rewritten for
    // chunking. Memoized per chunking context under module.code.
    [[nodiscard]] TaskGraph::Ref<js::ModuleCode> code_generation(const ChunkingContext& chunking) const;

private:
    const AssetContext& context_;
    std::shared_ptr<const Asset> source_;
};

}  // namespace quickpack
