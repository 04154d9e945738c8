#include "bundler.hpp"
#include "build_error.hpp"
#include "module_asset.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <future>
#include <iostream>
#include <thread>
#include <unordered_set>

namespace quickpack {

namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& path, const std::string& bytes) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw BuildError(path.generic_string(), "cannot create directory: " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw BuildError(path.generic_string(), "failed to open for writing");
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw BuildError(path.generic_string(), "failed to write");
    }
}

}  // namespace

Bundler::Bundler(Config config, const FileSystem& fs)
    : config_(std::move(config))
    , fs_(fs)
    , context_(graph_, fs, ResolveOptions::from_config(config_))
    , chunking_(config_.root)
    , thread_pool_(std::make_unique<ThreadPool>(config_)) {}

Bundler::~Bundler() {
    thread_pool_->shutdown();
}

BundleResult Bundler::build() {
    auto start = std::chrono::steady_clock::now();
    const uint64_t executions_before = graph_.executions();

    ModuleRef entry = context_.module(config_.entry.generic_string());

    BundleResult result;
    result.modules = collect_modules(entry);

    Code code = render_chunk(entry, result.modules, chunking_);
    result.map = code.generate_source_map();
    result.source_map = result.map->to_string();
    result.code = code.source_code() + "//# sourceMappingURL=" + map_file_name() + "\n";

    result.warnings = collect_warnings(result.modules);
    for (const auto& warning : result.warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }

    if (config_.verbose) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << "Bundled " << result.modules.size() << " modules in " << elapsed.count()
                  << " ms (" << graph_.executions() - executions_before << " tasks executed)\n";
    }
    return result;
}

std::vector<ModuleRef> Bundler::collect_modules(const ModuleRef& entry) {
    std::vector<ModuleRef> modules{entry};
    std::unordered_set<const EcmascriptModuleAsset*> visited{entry.get()};
    std::vector<ModuleRef> frontier{entry};

    // Breadth first; the reference sets of one level are computed in parallel
    while (!frontier.empty()) {
        std::vector<std::future<TaskGraph::Ref<std::vector<ModuleRef>>>> pending;
        pending.reserve(frontier.size());
        for (const auto& module : frontier) {
            pending.push_back(thread_pool_->enqueue([module] { return module->referenced_assets(); }));
        }

        std::vector<ModuleRef> next;
        for (auto& future : pending) {
            auto referenced = future.get();
            for (const auto& module : *referenced) {
                if (visited.insert(module.get()).second) {
                    next.push_back(module);
                    modules.push_back(module);
                }
            }
        }
        frontier = std::move(next);
    }

    std::sort(modules.begin() + 1, modules.end(), [this](const ModuleRef& a, const ModuleRef& b) {
        return chunking_.module_id(*a) < chunking_.module_id(*b);
    });
    return modules;
}

std::vector<std::string> Bundler::collect_warnings(const std::vector<ModuleRef>& modules) const {
    std::vector<std::string> warnings;
    for (const auto& module : modules) {
        for (const auto& reference : *module->references()) {
            if (reference->resolve_reference()->kind() == ResolveResult::Kind::Unresolvable) {
                warnings.push_back(chunking_.module_id(*module) + ": could not resolve " +
                                   reference->description());
            }
        }
    }
    return warnings;
}

std::string Bundler::map_file_name() const {
    return config_.source_map_output().filename().generic_string();
}

void Bundler::write(const BundleResult& result) const {
    write_file(config_.output, result.code);
    write_file(config_.source_map_output(), result.source_map);
}

size_t Bundler::invalidate_changes() {
    auto changed = invalidate_changed_files(graph_, fs_);
    if (config_.verbose) {
        for (const auto& path : changed) {
            std::cout << "Changed: " << path.generic_string() << "\n";
        }
    }
    return changed.size();
}

void Bundler::watch(const std::atomic<bool>& stop) {
    auto rebuild = [this] {
        try {
            auto result = build();
            write(result);
            std::cout << "Wrote " << config_.output.generic_string() << " (" << result.modules.size()
                      << " modules)\n";
        } catch (const BuildError& e) {
            // Keep watching: fixing the file triggers the next build
            std::cerr << "Error: " << e.what() << "\n";
        }
    };

    rebuild();
    std::cout << "Watching for changes...\n";

    while (!stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(config_.watch_interval_ms));
        if (stop) break;

        size_t changed = invalidate_changes();
        if (changed > 0) {
            std::cout << "\n" << changed << " file(s) changed, rebuilding...\n";
            rebuild();
        }
    }
}

}  // namespace quickpack
