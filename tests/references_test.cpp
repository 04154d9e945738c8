#include "chunk.hpp"
#include "js_parser.hpp"
#include "module_asset.hpp"
#include "references.hpp"
#include "resolve.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace quickpack;

namespace {

class ReferencesTest : public ::testing::Test {
protected:
    ReferencesTest() : context_(graph_, fs_, options()), chunking_("/app") {
        fs_.write("/app/a.js", "export const b = 1;\n");
        fs_.write("/app/b.js", "module.exports = 2;\n");
    }

    static ResolveOptions options() {
        ResolveOptions options;
        options.builtins = {"fs", "path"};
        return options;
    }

    std::string generate(const std::string& source) {
        fs_.write("/app/index.js", source);
        return context_.module("/app/index.js")->code_generation(chunking_)->code;
    }

    TaskGraph graph_;
    MemoryFileSystem fs_;
    AssetContext context_;
    SingleChunkingContext chunking_;
};

}  // namespace

// ============================================================================
// Extraction
// ============================================================================

TEST_F(ReferencesTest, ExtractsReferencesInSourceOrder) {
    auto program = js::parse_module(
        "import a from './a.js';\n"
        "export * from './b.js';\n"
        "const c = require('./c');\n"
        "f(import('./d'));\n");
    auto references = module_references(context_, "/app/index.js", program);
    ASSERT_EQ(references.size(), 4u);

    EXPECT_EQ(references[0]->description(), "import \"./a.js\"");
    EXPECT_EQ(references[1]->description(), "import \"./b.js\"");
    EXPECT_EQ(references[2]->description(), "require \"./c\"");
    EXPECT_EQ(references[3]->description(), "dynamic import \"./d\"");

    EXPECT_FALSE(references[0]->is_loaded_async());
    EXPECT_FALSE(references[2]->is_loaded_async());
    EXPECT_TRUE(references[3]->is_loaded_async());
    for (const auto& reference : references) {
        EXPECT_TRUE(reference->is_chunkable());
    }

    // Every reference points at the item it was written in
    for (const auto& reference : references) {
        const auto& path = dynamic_cast<const ModuleReference&>(*reference).path();
        ASSERT_FALSE(path.empty());
        EXPECT_LT(path.front(), program.body.size());
    }
}

TEST_F(ReferencesTest, CallRequestKinds) {
    auto program = js::parse_module("import();\nimport('./a');\nimport(...x);\nimport(name);\n");
    std::vector<Request> requests;
    for (const auto& item : program.body) {
        if (const auto* expr = std::get_if<js::Expr>(&item.node)) {
            requests.push_back(call_request(std::get<js::Call>(expr->node)));
        }
    }
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[0].kind(), Request::Kind::Empty);
    EXPECT_EQ(requests[1].kind(), Request::Kind::Relative);
    EXPECT_EQ(requests[2].kind(), Request::Kind::Dynamic);
    EXPECT_EQ(requests[3].kind(), Request::Kind::Dynamic);
}

TEST_F(ReferencesTest, ResolveReferenceIsMemoized) {
    fs_.write("/app/index.js", "import('./a.js');\n");
    auto references = context_.module("/app/index.js")->references();
    ASSERT_EQ(references->size(), 1u);
    EXPECT_EQ((*references)[0]->resolve_reference(), (*references)[0]->resolve_reference());
    EXPECT_EQ(context_.module("/app/index.js")->references(), references);
}

// ============================================================================
// Dynamic import
// ============================================================================

TEST_F(ReferencesTest, UnresolvableDynamicImportRejects) {
    EXPECT_EQ(generate("import('foo');\nimport();\n"),
              "Promise.reject(new Error('could not resolve \"' + 'foo' + '\" into a module'));\n"
              "Promise.reject(new Error('import() expressions require at least 1 argument'));\n");
}

TEST_F(ReferencesTest, SpreadDynamicImportRejects) {
    EXPECT_EQ(generate("import(...specs);\n"),
              "Promise.reject(new Error('spread operator is illegal in import() expressions.'));\n");
}

TEST_F(ReferencesTest, NonLiteralDynamicImportEmbedsTheExpression) {
    EXPECT_EQ(generate("import(name);\n"),
              "Promise.reject(new Error('could not resolve \"' + name + '\" into a module'));\n");
}

TEST_F(ReferencesTest, InternalDynamicImportGoesThroughTheLoader) {
    EXPECT_EQ(generate("import('./a.js').then(m => m.b);\n"),
              "__quickpack_require__('a.js?async')(__quickpack_import__).then(m => m.b);\n");
}

TEST_F(ReferencesTest, ExternalDynamicImportKeepsTheSpecifier) {
    EXPECT_EQ(generate("import('https://esm.sh/x');\n"), "import('https://esm.sh/x');\n");
    EXPECT_EQ(generate("import(`fs`);\n"), "import(\"fs\");\n");
}

// ============================================================================
// Static imports and re-exports
// ============================================================================

TEST_F(ReferencesTest, StaticImports) {
    EXPECT_EQ(generate("import def, { b as c } from './a.js';\n"),
              "const { default: def, b: c } = __quickpack_import__(\"a.js\");\n");
    EXPECT_EQ(generate("import * as ns from './a.js';\n"),
              "const ns = __quickpack_import__(\"a.js\");\n");
    EXPECT_EQ(generate("import './a.js';\n"), "__quickpack_import__(\"a.js\");\n");
}

TEST_F(ReferencesTest, ExternalStaticImport) {
    EXPECT_EQ(generate("import fs from 'fs';\n"),
              "const { default: fs } = __quickpack_external__(\"fs\");\n");
}

TEST_F(ReferencesTest, UnresolvableStaticImportThrows) {
    EXPECT_EQ(generate("import x from './nope';\n"),
              "throw new Error('could not resolve \"./nope\" into a module');\n");
}

TEST_F(ReferencesTest, ReExports) {
    EXPECT_EQ(generate("export * from './a.js';\n"
                       "export * as ns from './a.js';\n"
                       "export { b as c, d } from './a.js';\n"),
              "__quickpack_export_star__(__quickpack_import__(\"a.js\"));\n"
              "const __quickpack_reexport_2__ = __quickpack_import__(\"a.js\"); "
              "__quickpack_esm__({ ns: () => __quickpack_reexport_2__ });\n"
              "const __quickpack_reexport_4__ = __quickpack_import__(\"a.js\"); "
              "__quickpack_esm__({ c: () => __quickpack_reexport_4__.b, d: () => __quickpack_reexport_4__.d });\n");
}

TEST_F(ReferencesTest, LocalExports) {
    EXPECT_EQ(generate("export const a = 1;\n"
                       "export function f() {}\n"
                       "const g = 2;\n"
                       "export { g as h };\n"
                       "export default 42;\n"),
              "__quickpack_esm__({ a: () => a, f: () => f, h: () => g, default: () => __quickpack_default_export__ });\n"
              " const a = 1;\n"
              " function f() {}\n"
              "const g = 2;\n"
              "\n"
              "const __quickpack_default_export__ = 42;\n");
}

TEST_F(ReferencesTest, NamedDefaultExportKeepsItsDeclaration) {
    EXPECT_EQ(generate("export default function main() {}\n"),
              "__quickpack_esm__({ default: () => main });\n function main() {}\n");
}

// ============================================================================
// require
// ============================================================================

TEST_F(ReferencesTest, Require) {
    EXPECT_EQ(generate("const b = require('./b.js');\n"),
              "const b = __quickpack_require__('b.js');\n");
    EXPECT_EQ(generate("const p = require('path');\n"), "const p = require('path');\n");
}

TEST_F(ReferencesTest, UnresolvableRequireThrowsWhenCalled) {
    EXPECT_EQ(generate("require('b-missing');\n"),
              "(() => { throw new Error('could not resolve \"' + 'b-missing' + '\" into a module'); })();\n");
    EXPECT_EQ(generate("require();\n"),
              "(() => { throw new Error('require() expressions require at least 1 argument'); })();\n");
}

TEST_F(ReferencesTest, FunctionsNamedRequireOrImportAreLeftAlone) {
    const std::string source =
        "function require(name) { return cache[name]; }\n"
        "const api = { require(id) { return id; } };\n"
        "class Loader { import(spec) { return load(spec); } }\n";
    EXPECT_EQ(generate(source), source);
    EXPECT_TRUE(context_.module("/app/index.js")->references()->empty());
}

TEST_F(ReferencesTest, NestedReferencesAreRewrittenInnermostFirst) {
    EXPECT_EQ(generate("require(require('./b.js'));\n"),
              "(() => { throw new Error('could not resolve \"' + __quickpack_require__('b.js') + "
              "'\" into a module'); })();\n");
    EXPECT_EQ(generate("import(import('./a.js'));\n"),
              "Promise.reject(new Error('could not resolve \"' + "
              "__quickpack_require__('a.js?async')(__quickpack_import__) + '\" into a module'));\n");
}

TEST_F(ReferencesTest, JsonModule) {
    fs_.write("/app/data.json", "{\"k\": 1}");
    EXPECT_EQ(context_.module("/app/data.json")->code_generation(chunking_)->code,
              "module.exports = {\"k\": 1};\n");
    EXPECT_TRUE(context_.module("/app/data.json")->references()->empty());
}

TEST_F(ReferencesTest, ReferencedAssetsAreDeduplicated) {
    fs_.write("/app/index.js",
              "import './a.js';\nimport('./a.js');\nrequire('./b.js');\nrequire('fs');\nimport('nope');\n");
    auto assets = context_.module("/app/index.js")->referenced_assets();
    ASSERT_EQ(assets->size(), 2u);
    EXPECT_EQ((*assets)[0]->path(), "/app/a.js");
    EXPECT_EQ((*assets)[1]->path(), "/app/b.js");
}

TEST_F(ReferencesTest, CodeGenerationLeavesTheSnapshotUntouched) {
    fs_.write("/app/index.js", "import('./a.js');\n");
    auto module = context_.module("/app/index.js");
    auto before = module->parse();
    (void)module->code_generation(chunking_);
    const auto& call = std::get<js::Call>(std::get<js::Expr>(module->parse()->body[0].node).node);
    EXPECT_TRUE(std::holds_alternative<js::Import>(call.callee->node));
    EXPECT_EQ(module->parse(), before);
}

// ============================================================================
// Visitors
// ============================================================================

TEST(VisitorTest, MismatchedPathIsALogicError) {
    auto program = js::parse_module("a;\n");
    std::vector<js::Visitor> visitors;
    visitors.push_back(js::visit_call({0}, [](js::Call&, js::Span) {}));
    EXPECT_THROW(js::apply_visitors(program, visitors), std::logic_error);

    std::vector<js::Visitor> out_of_range;
    out_of_range.push_back(js::visit_item({42}, [](js::ModuleItem&) {}));
    EXPECT_THROW(js::apply_visitors(program, out_of_range), std::logic_error);
}
