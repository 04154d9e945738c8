#include "module_asset.hpp"
#include "chunk.hpp"
#include "js_parser.hpp"
#include "references.hpp"
#include "remote_fetch.hpp"
#include "resolve.hpp"

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace quickpack {

namespace {

bool ends_with(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

// A JSON document becomes a CommonJS module exporting the parsed value
js::Program json_program(const std::string& text) {
    js::Program program;
    program.body.push_back(js::ModuleItem{js::Synthetic{"module.exports = "}, js::Span{}});
    program.body.push_back(js::ModuleItem{
        js::RawText{text}, js::Span{0, static_cast<uint32_t>(text.size())}});
    program.body.push_back(js::ModuleItem{js::Synthetic{";\n"}, js::Span{}});
    return program;
}

}  // namespace

EcmascriptModuleAsset::EcmascriptModuleAsset(const AssetContext& context,
                                             std::shared_ptr<const Asset> source)
    : context_(context)
    , source_(std::move(source)) {}

bool EcmascriptModuleAsset::is_json() const {
    return ends_with(path(), ".json");
}

bool EcmascriptModuleAsset::is_remote() const {
    return is_remote_url(path());
}

std::string EcmascriptModuleAsset::origin() const {
    if (const auto* remote = dynamic_cast<const RemoteAsset*>(source_.get())) {
        return remote->effective_url();
    }
    return path();
}

TaskGraph::Ref<js::Program> EcmascriptModuleAsset::parse() const {
    TaskKey key{"module.parse", path() + "|" + context_.key()};
    return context_.graph().run<js::Program>(key, [this] {
        auto content = this->content();
        if (is_json()) {
            return json_program(content->bytes);
        }
        return js::parse_module(content->bytes);
    });
}

TaskGraph::Ref<std::vector<ReferenceRef>> EcmascriptModuleAsset::references() const {
    return context_.graph().run<std::vector<ReferenceRef>>(
        TaskKey{"module.references", path() + "|" + context_.key()}, [this] {
            auto program = parse();
            return module_references(context_, origin(), *program);
        });
}

TaskGraph::Ref<std::vector<ModuleRef>> EcmascriptModuleAsset::referenced_assets() const {
    return context_.graph().run<std::vector<ModuleRef>>(
        TaskKey{"module.referenced_assets", path() + "|" + context_.key()}, [this] {
            std::vector<ModuleRef> modules;
            std::unordered_set<const EcmascriptModuleAsset*> seen;
            for (const auto& reference : *references()) {
                auto result = reference->resolve_reference();
                for (const auto& module : result->modules()) {
                    if (seen.insert(module.get()).second) {
                        modules.push_back(module);
                    }
                }
            }
            return modules;
        });
}

TaskGraph::Ref<js::ModuleCode> EcmascriptModuleAsset::code_generation(
    const ChunkingContext& chunking) const {
    TaskKey key{"module.code", path() + "|" + context_.key() + "|" + chunking.key()};
    return context_.graph().run<js::ModuleCode>(key, [this, &chunking] {
        auto snapshot = parse();
        auto content = this->content();

        CodeGeneration visitors;
        for (const auto& reference : *references()) {
            auto generated = reference->code_generation(chunking);
            std::move(generated.begin(), generated.end(), std::back_inserter(visitors));
        }
        auto exports = esm_exports_code_generation(*snapshot);
        std::move(exports.begin(), exports.end(), std::back_inserter(visitors));

        // Nested calls are rewritten before the calls containing them
        std::stable_sort(visitors.begin(), visitors.end(),
                         [](const js::Visitor& a, const js::Visitor& b) {
                             return a.path.size() > b.path.size();
                         });

        js::Program program = *snapshot;
        js::apply_visitors(program, visitors);
        return js::emit_module(program, content->bytes, chunking.module_id(*this));
    });
}

}  // namespace quickpack
