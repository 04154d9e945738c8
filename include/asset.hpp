#pragma once

#include "file_system.hpp"
#include "js_ast.hpp"
#include "task_graph.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace quickpack {

class ChunkingContext;
class EcmascriptModuleAsset;

using ModuleRef = std::shared_ptr<const EcmascriptModuleAsset>;

// Visitors a reference contributes to its module's code generation
using CodeGeneration = std::vector<js::Visitor>;

// Outcome of resolving one request
class ResolveResult {
public:
    enum class Kind : uint8_t {
        Single,
        Alternatives,  // Candidates in priority order
        External,      // Intentionally left outside the bundle
        Unresolvable,
    };

    [[nodiscard]] static ResolveResult single(ModuleRef module);
    [[nodiscard]] static ResolveResult alternatives(std::vector<ModuleRef> modules);
    [[nodiscard]] static ResolveResult external(std::string specifier);
    [[nodiscard]] static ResolveResult unresolvable();

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

    // Single: one module; Alternatives: every candidate; otherwise empty
    [[nodiscard]] const std::vector<ModuleRef>& modules() const noexcept { return modules_; }

    // External only
    [[nodiscard]] const std::string& specifier() const noexcept { return specifier_; }

    [[nodiscard]] std::string to_string() const;

private:
    Kind kind_ = Kind::Unresolvable;
    std::vector<ModuleRef> modules_;
    std::string specifier_;
};

class AssetReference;
using ReferenceRef = std::shared_ptr<const AssetReference>;

// A named, content-bearing unit of the build graph
class Asset {
public:
    virtual ~Asset() = default;

    // Identity: a normalized file path or a URL
    [[nodiscard]] virtual const std::string& path() const noexcept = 0;

    // Throws BuildError when the content cannot be obtained
    [[nodiscard]] virtual TaskGraph::Ref<FileContent> content() const = 0;

    [[nodiscard]] virtual TaskGraph::Ref<std::vector<ReferenceRef>> references() const = 0;
};

// Edge from an asset to whatever its request resolves to
class AssetReference {
public:
    virtual ~AssetReference() = default;

    // Memoized through esm_resolve; stable for the same request and context
    [[nodiscard]] virtual TaskGraph::Ref<ResolveResult> resolve_reference() const = 0;

    // Whether a chunking policy may place the target in another chunk
    [[nodiscard]] virtual bool is_chunkable() const noexcept = 0;

    // Whether reaching the target needs an asynchronous load
    [[nodiscard]] virtual bool is_loaded_async() const noexcept = 0;

    // Diagnostics only
    [[nodiscard]] virtual std::string description() const = 0;

    [[nodiscard]] virtual CodeGeneration code_generation(const ChunkingContext& chunking) const = 0;
};

// A file read through the task graph
class SourceAsset final : public Asset {
public:
    SourceAsset(TaskGraph& graph, const FileSystem& fs, const std::filesystem::path& path);

    [[nodiscard]] const std::string& path() const noexcept override { return path_; }
    [[nodiscard]] TaskGraph::Ref<FileContent> content() const override;
    [[nodiscard]] TaskGraph::Ref<std::vector<ReferenceRef>> references() const override;

private:
    TaskGraph& graph_;
    const FileSystem& fs_;
    std::string path_;
};

// An http(s) module fetched with libcurl
class RemoteAsset final : public Asset {
public:
    RemoteAsset(TaskGraph& graph, std::string url);

    [[nodiscard]] const std::string& path() const noexcept override { return url_; }
    [[nodiscard]] TaskGraph::Ref<FileContent> content() const override;
    [[nodiscard]] TaskGraph::Ref<std::vector<ReferenceRef>> references() const override;

    // URL after redirects, against which relative imports resolve
    [[nodiscard]] std::string effective_url() const;

private:
    TaskGraph& graph_;
    std::string url_;
};

}  // namespace quickpack
