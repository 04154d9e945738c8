#pragma once

#include "asset.hpp"
#include "config.hpp"
#include "file_system.hpp"
#include "request.hpp"
#include "task_graph.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quickpack {

struct ResolveOptions {
    std::vector<std::string> extensions = {".js", ".mjs", ".cjs", ".json"};
    std::vector<std::string> main_fields = {"module", "main"};
    std::vector<std::string> builtins;
    bool fetch_remote = false;

    [[nodiscard]] static ResolveOptions from_config(const Config& config);

    // Canonical string used in memoization keys
    [[nodiscard]] std::string key() const;
};

// Everything resolution depends on besides the request: the task graph, the
// file system, the options, and the interned module assets.
class AssetContext {
public:
    AssetContext(TaskGraph& graph, const FileSystem& fs, ResolveOptions options = {});

    AssetContext(const AssetContext&) = delete;
    AssetContext& operator=(const AssetContext&) = delete;

    [[nodiscard]] TaskGraph& graph() const noexcept { return graph_; }
    [[nodiscard]] const FileSystem& fs() const noexcept { return fs_; }
    [[nodiscard]] const ResolveOptions& options() const noexcept { return options_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    // The one module asset for a file path or URL
    [[nodiscard]] ModuleRef module(const std::string& path) const;

    [[nodiscard]] size_t module_count() const;

private:
    TaskGraph& graph_;
    const FileSystem& fs_;
    ResolveOptions options_;
    std::string key_;

    mutable std::mutex modules_mutex_;
    mutable std::unordered_map<std::string, ModuleRef> modules_;
};

// Resolves request as written in the module at origin (a file path or URL).
// Memoized per (request, origin directory, context); every file probe is a
// memoized read so that file changes invalidate the results that probed them.
[[nodiscard]] TaskGraph::Ref<ResolveResult> esm_resolve(const AssetContext& context,
                                                        const std::string& origin,
                                                        const Request& request);

}  // namespace quickpack
