#pragma once

#include "asset.hpp"
#include "js_ast.hpp"
#include "request.hpp"

#include <string>
#include <vector>

namespace quickpack {

class AssetContext;

// Names of the runtime surface emitted into generated code
namespace runtime {
inline constexpr const char* kRequire = "__quickpack_require__";
inline constexpr const char* kImport = "__quickpack_import__";
inline constexpr const char* kEsm = "__quickpack_esm__";
inline constexpr const char* kExportStar = "__quickpack_export_star__";
inline constexpr const char* kExternal = "__quickpack_external__";
inline constexpr const char* kDefaultExport = "__quickpack_default_export__";
}  // namespace runtime

// State shared by the reference kinds: where the request was written and
// the AST coordinate its code generation rewrites.
class ModuleReference : public AssetReference {
public:
    [[nodiscard]] TaskGraph::Ref<ResolveResult> resolve_reference() const override;
    [[nodiscard]] bool is_chunkable() const noexcept override { return true; }

    [[nodiscard]] const Request& request() const noexcept { return request_; }
    [[nodiscard]] const js::AstPath& path() const noexcept { return path_; }

protected:
    ModuleReference(const AssetContext& context, std::string origin, Request request,
                    js::AstPath path);

    const AssetContext& context_;
    std::string origin_;
    Request request_;
    js::AstPath path_;
};

// Static import declaration or re-export
class EsmAssetReference final : public ModuleReference {
public:
    EsmAssetReference(const AssetContext& context, std::string origin, Request request,
                      js::AstPath path)
        : ModuleReference(context, std::move(origin), std::move(request), std::move(path)) {}

    [[nodiscard]] bool is_loaded_async() const noexcept override { return false; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] CodeGeneration code_generation(const ChunkingContext& chunking) const override;
};

// import(...)
class EsmAsyncAssetReference final : public ModuleReference {
public:
    EsmAsyncAssetReference(const AssetContext& context, std::string origin, Request request,
                           js::AstPath path)
        : ModuleReference(context, std::move(origin), std::move(request), std::move(path)) {}

    [[nodiscard]] bool is_loaded_async() const noexcept override { return true; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] CodeGeneration code_generation(const ChunkingContext& chunking) const override;
};

// require(...)
class CjsRequireAssetReference final : public ModuleReference {
public:
    CjsRequireAssetReference(const AssetContext& context, std::string origin, Request request,
                             js::AstPath path)
        : ModuleReference(context, std::move(origin), std::move(request), std::move(path)) {}

    [[nodiscard]] bool is_loaded_async() const noexcept override { return false; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] CodeGeneration code_generation(const ChunkingContext& chunking) const override;
};

// Request written as the first argument of an import() or require() call
[[nodiscard]] Request call_request(const js::Call& call);

// References of a scanned module, in source order
[[nodiscard]] std::vector<ReferenceRef> module_references(const AssetContext& context,
                                                          const std::string& origin,
                                                          const js::Program& program);

// Rewrites local exports into getter registrations through __quickpack_esm__
[[nodiscard]] CodeGeneration esm_exports_code_generation(const js::Program& program);

}  // namespace quickpack
