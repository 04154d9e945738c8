#include "resolve.hpp"
#include "build_error.hpp"
#include "module_asset.hpp"
#include "remote_fetch.hpp"

#include <algorithm>
#include <optional>

#include <nlohmann/json.hpp>

namespace quickpack {

namespace fs = std::filesystem;

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += values[i];
    }
    return out;
}

// Directory relative requests are resolved from
std::string origin_directory(const std::string& origin) {
    if (is_remote_url(origin)) {
        size_t slash = origin.rfind('/');
        return slash == std::string::npos ? origin : origin.substr(0, slash + 1);
    }
    return normalize_path(fs::path(origin).parent_path()).generic_string();
}

class Resolver {
public:
    Resolver(const AssetContext& context, std::string directory)
        : context_(context)
        , graph_(context.graph())
        , directory_(std::move(directory)) {}

    ResolveResult resolve(const Request& request) {
        switch (request.kind()) {
            case Request::Kind::Relative:
            case Request::Kind::Absolute:
                return resolve_path(request);
            case Request::Kind::Module:
                return resolve_module(request);
            case Request::Kind::Uri:
                return resolve_uri(request.specifier(), request.module());
            case Request::Kind::Dynamic:
            case Request::Kind::Empty:
            case Request::Kind::Unknown:
                return ResolveResult::unresolvable();
        }
        return ResolveResult::unresolvable();
    }

private:
    ResolveResult resolve_path(const Request& request) {
        if (is_remote_url(directory_)) {
            std::string url = join_url(directory_, request.specifier());
            return resolve_uri(url, url.substr(0, url.find(':')));
        }

        fs::path target = request.kind() == Request::Kind::Absolute
                              ? fs::path(request.specifier())
                              : fs::path(directory_) / request.specifier();
        if (auto found = resolve_file_or_directory(normalize_path(target))) {
            return ResolveResult::single(context_.module(found->generic_string()));
        }
        return ResolveResult::unresolvable();
    }

    ResolveResult resolve_module(const Request& request) {
        const auto& builtins = context_.options().builtins;
        if (std::find(builtins.begin(), builtins.end(), request.module()) != builtins.end()) {
            return ResolveResult::external(request.specifier());
        }
        if (is_remote_url(directory_)) {
            return ResolveResult::unresolvable();
        }

        // Walk up looking for node_modules/<name>
        fs::path dir(directory_);
        while (true) {
            fs::path package = dir / "node_modules" / request.module();
            if (file_kind(graph_, context_.fs(), package) == FileKind::Directory) {
                std::optional<fs::path> found;
                if (request.path().empty()) {
                    found = resolve_directory(normalize_path(package));
                } else {
                    found = resolve_file_or_directory(normalize_path(package / request.path().substr(1)));
                }
                if (found) {
                    return ResolveResult::single(context_.module(found->generic_string()));
                }
                return ResolveResult::unresolvable();
            }
            if (!dir.has_parent_path() || dir.parent_path() == dir) {
                break;
            }
            dir = dir.parent_path();
        }
        return ResolveResult::unresolvable();
    }

    ResolveResult resolve_uri(const std::string& specifier, const std::string& scheme) {
        if ((scheme == "http" || scheme == "https") && context_.options().fetch_remote) {
            return ResolveResult::single(context_.module(specifier));
        }
        return ResolveResult::external(specifier);
    }

    std::optional<fs::path> resolve_file(const fs::path& path) {
        if (file_kind(graph_, context_.fs(), path) == FileKind::File) {
            return path;
        }
        for (const auto& ext : context_.options().extensions) {
            fs::path candidate = path;
            candidate += ext;
            if (file_kind(graph_, context_.fs(), candidate) == FileKind::File) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    std::optional<fs::path> resolve_file_or_directory(const fs::path& path) {
        if (auto file = resolve_file(path)) {
            return file;
        }
        if (file_kind(graph_, context_.fs(), path) == FileKind::Directory) {
            return resolve_directory(path);
        }
        return std::nullopt;
    }

    std::optional<fs::path> resolve_directory(const fs::path& dir) {
        fs::path manifest = dir / "package.json";
        auto content = read_file(graph_, context_.fs(), manifest);
        if (content->has_value()) {
            nlohmann::json package;
            try {
                package = nlohmann::json::parse((*content)->bytes);
            } catch (const nlohmann::json::parse_error& e) {
                throw BuildError(manifest.generic_string(), std::string("invalid package.json: ") + e.what());
            }

            if (package.is_object()) {
                for (const auto& field : context_.options().main_fields) {
                    auto it = package.find(field);
                    if (it == package.end() || !it->is_string()) {
                        continue;
                    }
                    fs::path main = normalize_path(dir / it->get<std::string>());
                    if (auto file = resolve_file(main)) {
                        return file;
                    }
                    if (file_kind(graph_, context_.fs(), main) == FileKind::Directory) {
                        if (auto index = resolve_file(main / "index")) {
                            return index;
                        }
                    }
                }
            }
        }
        return resolve_file(dir / "index");
    }

    const AssetContext& context_;
    TaskGraph& graph_;
    std::string directory_;
};

}  // namespace

// ============================================================================
// ResolveOptions
// ============================================================================

ResolveOptions ResolveOptions::from_config(const Config& config) {
    ResolveOptions options;
    options.extensions = config.extensions;
    options.main_fields = config.main_fields;
    options.builtins = config.builtins;
    options.fetch_remote = config.fetch_remote;
    return options;
}

std::string ResolveOptions::key() const {
    return join(extensions) + ";" + join(main_fields) + ";" + join(builtins) + ";" +
           (fetch_remote ? "remote" : "local");
}

// ============================================================================
// AssetContext
// ============================================================================

AssetContext::AssetContext(TaskGraph& graph, const FileSystem& fs, ResolveOptions options)
    : graph_(graph)
    , fs_(fs)
    , options_(std::move(options))
    , key_(fs.name() + "|" + options_.key()) {}

ModuleRef AssetContext::module(const std::string& path) const {
    const bool remote = is_remote_url(path);
    const std::string id = remote ? path : normalize_path(path).generic_string();

    std::lock_guard lock(modules_mutex_);
    auto it = modules_.find(id);
    if (it != modules_.end()) {
        return it->second;
    }

    std::shared_ptr<const Asset> source;
    if (remote) {
        source = std::make_shared<RemoteAsset>(graph_, id);
    } else {
        source = std::make_shared<SourceAsset>(graph_, fs_, id);
    }
    ModuleRef module = std::make_shared<EcmascriptModuleAsset>(*this, std::move(source));
    modules_.emplace(id, module);
    return module;
}

size_t AssetContext::module_count() const {
    std::lock_guard lock(modules_mutex_);
    return modules_.size();
}

// ============================================================================
// esm_resolve
// ============================================================================

TaskGraph::Ref<ResolveResult> esm_resolve(const AssetContext& context, const std::string& origin,
                                          const Request& request) {
    std::string directory = origin_directory(origin);
    TaskKey key{"esm_resolve", request.key() + "|" + directory + "|" + context.key()};
    return context.graph().run<ResolveResult>(key, [&] {
        return Resolver(context, directory).resolve(request);
    });
}

}  // namespace quickpack
