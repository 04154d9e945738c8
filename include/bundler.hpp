#pragma once

#include "asset.hpp"
#include "chunk.hpp"
#include "config.hpp"
#include "file_system.hpp"
#include "resolve.hpp"
#include "task_graph.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace quickpack {

struct BundleResult {
    std::string code;        // Ends with a sourceMappingURL comment
    std::string source_map;  // Sectioned v3 map as JSON
    std::shared_ptr<const SourceMap> map;
    std::vector<ModuleRef> modules;     // Entry first, then by module id
    std::vector<std::string> warnings;  // One per unresolvable reference
};

// Builds one chunk from an entry module. The task graph persists across
// builds so that a rebuild after invalidate_changes() only recomputes what
// the changed files affect.
class Bundler {
public:
    Bundler(Config config, const FileSystem& fs);
    ~Bundler();

    Bundler(const Bundler&) = delete;
    Bundler& operator=(const Bundler&) = delete;

    // Throws BuildError on infrastructural failures
    [[nodiscard]] BundleResult build();

    // Writes the bundle and its map next to each other on disk
    void write(const BundleResult& result) const;

    // Invalidates the memoized reads of files that changed since they were
    // read. Returns the number of changed files.
    size_t invalidate_changes();

    // Builds, writes, then rebuilds whenever a file changes until stop is set
    void watch(const std::atomic<bool>& stop);

    [[nodiscard]] TaskGraph& graph() noexcept { return graph_; }
    [[nodiscard]] const AssetContext& context() const noexcept { return context_; }
    [[nodiscard]] const ChunkingContext& chunking() const noexcept { return chunking_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::vector<ModuleRef> collect_modules(const ModuleRef& entry);
    [[nodiscard]] std::vector<std::string> collect_warnings(const std::vector<ModuleRef>& modules) const;
    [[nodiscard]] std::string map_file_name() const;

    Config config_;
    const FileSystem& fs_;
    TaskGraph graph_;
    AssetContext context_;
    SingleChunkingContext chunking_;
    std::unique_ptr<ThreadPool> thread_pool_;
};

}  // namespace quickpack
