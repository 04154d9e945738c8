#include "chunk.hpp"
#include "js_printer.hpp"
#include "module_asset.hpp"
#include "references.hpp"
#include "remote_fetch.hpp"

#include <unordered_set>

namespace quickpack {

namespace {

// Module runtime. Modules are factories registered by id and instantiated on
// first require; each factory receives its own __quickpack_esm__ and
// __quickpack_export_star__ bound to its exports.
constexpr std::string_view kRuntime = R"((function () {
var __quickpack_modules__ = Object.create(null);
var __quickpack_cache__ = Object.create(null);
function __quickpack_mark_esm__(exports) {
    if (!Object.prototype.hasOwnProperty.call(exports, "__esModule")) {
        Object.defineProperty(exports, "__esModule", { value: true });
    }
}
function __quickpack_define_getters__(exports, getters) {
    __quickpack_mark_esm__(exports);
    for (var name in getters) {
        Object.defineProperty(exports, name, { enumerable: true, configurable: true, get: getters[name] });
    }
}
function __quickpack_reexport_all__(exports, namespace) {
    __quickpack_mark_esm__(exports);
    Object.keys(namespace).forEach(function (name) {
        if (name !== "default" && !Object.prototype.hasOwnProperty.call(exports, name)) {
            Object.defineProperty(exports, name, { enumerable: true, configurable: true, get: function () { return namespace[name]; } });
        }
    });
}
function __quickpack_require__(id) {
    var cached = __quickpack_cache__[id];
    if (cached !== undefined) {
        return cached.exports;
    }
    var factory = __quickpack_modules__[id];
    if (factory === undefined) {
        throw new Error('module "' + id + '" is not part of this bundle');
    }
    var module = { exports: {} };
    __quickpack_cache__[id] = module;
    factory.call(module.exports, module, module.exports,
        function (getters) { __quickpack_define_getters__(module.exports, getters); },
        function (namespace) { __quickpack_reexport_all__(module.exports, namespace); });
    return module.exports;
}
function __quickpack_interop__(exports) {
    if (exports !== null && typeof exports === "object" && exports.__esModule) {
        return exports;
    }
    var namespace = {};
    if (exports !== null && (typeof exports === "object" || typeof exports === "function")) {
        Object.keys(exports).forEach(function (name) {
            Object.defineProperty(namespace, name, { enumerable: true, get: function () { return exports[name]; } });
        });
    }
    Object.defineProperty(namespace, "default", { enumerable: true, value: exports });
    return namespace;
}
function __quickpack_import__(id) {
    return __quickpack_interop__(__quickpack_require__(id));
}
function __quickpack_external__(specifier) {
    if (typeof require === "function") {
        return __quickpack_interop__(require(specifier));
    }
    throw new Error('external module "' + specifier + '" is not available');
}
)";

constexpr std::string_view kFactoryParams =
    "function (module, exports, __quickpack_esm__, __quickpack_export_star__) {\n";

std::string quoted(std::string_view value) {
    return "\"" + js::escape_string(value, '"') + "\"";
}

}  // namespace

// ============================================================================
// SingleChunkingContext
// ============================================================================

SingleChunkingContext::SingleChunkingContext(std::filesystem::path root, std::string chunk_name)
    : root_(normalize_path(root))
    , chunk_name_(std::move(chunk_name)) {}

std::string SingleChunkingContext::key() const {
    return "single|" + chunk_name_ + "|" + root_.generic_string();
}

std::string SingleChunkingContext::module_id(const Asset& asset) const {
    const std::string& path = asset.path();
    if (is_remote_url(path)) {
        return path;
    }
    std::filesystem::path relative = std::filesystem::path(path).lexically_relative(root_);
    if (relative.empty()) {
        return path;
    }
    return relative.generic_string();
}

std::string SingleChunkingContext::async_loader_id(const Asset& asset) const {
    return module_id(asset) + "?async";
}

ChunkPlacement SingleChunkingContext::placement(const Asset& /*asset*/) const {
    return ChunkPlacement::SameChunk;
}

// ============================================================================
// Chunk rendering
// ============================================================================

Code render_chunk(const ModuleRef& entry, const std::vector<ModuleRef>& modules,
                  const ChunkingContext& chunking) {
    Code code;
    code.push_bytes(kRuntime);

    std::vector<ModuleRef> async_targets;
    std::unordered_set<const EcmascriptModuleAsset*> seen;

    for (const auto& module : modules) {
        if (chunking.placement(*module) != ChunkPlacement::SameChunk) {
            continue;
        }

        auto generated = module->code_generation(chunking);

        code.push_bytes("__quickpack_modules__[" + quickpack::quoted(chunking.module_id(*module)) + "] = ");
        code.push_bytes(kFactoryParams);
        code.push_source(generated->code, std::make_shared<StaticSourceMap>(generated->map));
        code.push_bytes("\n};\n");

        for (const auto& reference : *module->references()) {
            if (!reference->is_loaded_async()) {
                continue;
            }
            for (const auto& target : reference->resolve_reference()->modules()) {
                if (seen.insert(target.get()).second) {
                    async_targets.push_back(target);
                }
            }
        }
    }

    for (const auto& target : async_targets) {
        code.push_bytes("__quickpack_modules__[" + quickpack::quoted(chunking.async_loader_id(*target)) +
                        "] = function (module) {\n    module.exports = function (importFn) {\n"
                        "        return Promise.resolve().then(function () { return importFn(" +
                        quickpack::quoted(chunking.module_id(*target)) + "); });\n    };\n};\n");
    }

    code.push_bytes(std::string(runtime::kRequire) + "(" + quickpack::quoted(chunking.module_id(*entry)) + ");\n})();\n");
    return code;
}

}  // namespace quickpack
