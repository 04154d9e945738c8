#include "asset.hpp"
#include "build_error.hpp"
#include "module_asset.hpp"
#include "remote_fetch.hpp"

namespace quickpack {

// ============================================================================
// ResolveResult
// ============================================================================

ResolveResult ResolveResult::single(ModuleRef module) {
    ResolveResult result;
    result.kind_ = Kind::Single;
    result.modules_.push_back(std::move(module));
    return result;
}

ResolveResult ResolveResult::alternatives(std::vector<ModuleRef> modules) {
    if (modules.empty()) {
        return unresolvable();
    }
    ResolveResult result;
    result.kind_ = Kind::Alternatives;
    result.modules_ = std::move(modules);
    return result;
}

ResolveResult ResolveResult::external(std::string specifier) {
    ResolveResult result;
    result.kind_ = Kind::External;
    result.specifier_ = std::move(specifier);
    return result;
}

ResolveResult ResolveResult::unresolvable() {
    return ResolveResult{};
}

std::string ResolveResult::to_string() const {
    switch (kind_) {
        case Kind::Single:
            return "module " + modules_.front()->path();
        case Kind::Alternatives: {
            std::string out = "alternatives [";
            for (size_t i = 0; i < modules_.size(); ++i) {
                if (i > 0) out += ", ";
                out += modules_[i]->path();
            }
            return out + "]";
        }
        case Kind::External:
            return "external " + specifier_;
        case Kind::Unresolvable:
            return "unresolvable";
    }
    return "unresolvable";
}

// ============================================================================
// SourceAsset
// ============================================================================

SourceAsset::SourceAsset(TaskGraph& graph, const FileSystem& fs, const std::filesystem::path& path)
    : graph_(graph)
    , fs_(fs)
    , path_(normalize_path(path).generic_string()) {}

TaskGraph::Ref<FileContent> SourceAsset::content() const {
    auto file = read_file(graph_, fs_, path_);
    if (!file->has_value()) {
        throw BuildError(path_, "file not found");
    }
    // Aliases the cached optional so no copy of the bytes is made
    return TaskGraph::Ref<FileContent>(file, &**file);
}

TaskGraph::Ref<std::vector<ReferenceRef>> SourceAsset::references() const {
    static const auto none = std::make_shared<const std::vector<ReferenceRef>>();
    return none;
}

// ============================================================================
// RemoteAsset
// ============================================================================

RemoteAsset::RemoteAsset(TaskGraph& graph, std::string url)
    : graph_(graph)
    , url_(std::move(url)) {}

TaskGraph::Ref<FileContent> RemoteAsset::content() const {
    auto module = fetch_remote(graph_, url_);
    return TaskGraph::Ref<FileContent>(module, &module->content);
}

TaskGraph::Ref<std::vector<ReferenceRef>> RemoteAsset::references() const {
    static const auto none = std::make_shared<const std::vector<ReferenceRef>>();
    return none;
}

std::string RemoteAsset::effective_url() const {
    return fetch_remote(graph_, url_)->effective_url;
}

}  // namespace quickpack
