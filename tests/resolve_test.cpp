#include "build_error.hpp"
#include "module_asset.hpp"
#include "resolve.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace quickpack;

namespace {

class ResolveTest : public ::testing::Test {
protected:
    ResolveTest() : context_(graph_, fs_, options()) {
        fs_.write("/app/src/index.js", "");
        fs_.write("/app/src/util.js", "");
        fs_.write("/app/src/data.json", "{}");
        fs_.write("/app/src/lib/index.js", "");
        fs_.write("/app/node_modules/pkg/package.json", R"({"main": "dist/main.js"})");
        fs_.write("/app/node_modules/pkg/dist/main.js", "");
        fs_.write("/app/node_modules/pkg/extra.js", "");
        fs_.write("/app/node_modules/@scope/modular/package.json", R"({"module": "esm", "main": "cjs.js"})");
        fs_.write("/app/node_modules/@scope/modular/esm/index.mjs", "");
        fs_.write("/app/node_modules/@scope/modular/cjs.js", "");
        fs_.write("/app/node_modules/noman/index.js", "");
    }

    static ResolveOptions options() {
        ResolveOptions options;
        options.builtins = {"fs", "path"};
        return options;
    }

    ResolveResult resolve(const std::string& specifier, const std::string& origin = "/app/src/index.js") {
        return *esm_resolve(context_, origin, Request::parse(specifier));
    }

    std::string resolved_path(const std::string& specifier,
                              const std::string& origin = "/app/src/index.js") {
        auto result = resolve(specifier, origin);
        if (result.kind() != ResolveResult::Kind::Single) {
            return "<" + result.to_string() + ">";
        }
        return result.modules().front()->path();
    }

    TaskGraph graph_;
    MemoryFileSystem fs_;
    AssetContext context_;
};

}  // namespace

TEST_F(ResolveTest, RelativeWithExtensions) {
    EXPECT_EQ(resolved_path("./util"), "/app/src/util.js");
    EXPECT_EQ(resolved_path("./util.js"), "/app/src/util.js");
    EXPECT_EQ(resolved_path("./data.json"), "/app/src/data.json");
    EXPECT_EQ(resolved_path("../src/./util"), "/app/src/util.js");
    EXPECT_EQ(resolved_path("/app/src/util"), "/app/src/util.js");
}

TEST_F(ResolveTest, DirectoryIndex) {
    EXPECT_EQ(resolved_path("./lib"), "/app/src/lib/index.js");
}

TEST_F(ResolveTest, PackageMainFields) {
    EXPECT_EQ(resolved_path("pkg"), "/app/node_modules/pkg/dist/main.js");
    EXPECT_EQ(resolved_path("pkg/extra"), "/app/node_modules/pkg/extra.js");
    // "module" wins over "main" and may name a directory
    EXPECT_EQ(resolved_path("@scope/modular"), "/app/node_modules/@scope/modular/esm/index.mjs");
    EXPECT_EQ(resolved_path("noman"), "/app/node_modules/noman/index.js");
}

TEST_F(ResolveTest, NodeModulesWalkFromNestedDirectory) {
    EXPECT_EQ(resolved_path("pkg", "/app/src/lib/index.js"), "/app/node_modules/pkg/dist/main.js");
}

TEST_F(ResolveTest, BuiltinsAreExternal) {
    auto result = resolve("fs");
    EXPECT_EQ(result.kind(), ResolveResult::Kind::External);
    EXPECT_EQ(result.specifier(), "fs");

    EXPECT_EQ(resolve("path/posix").kind(), ResolveResult::Kind::External);
}

TEST_F(ResolveTest, UrisAreExternalWithoutRemoteFetching) {
    auto result = resolve("https://esm.sh/react");
    EXPECT_EQ(result.kind(), ResolveResult::Kind::External);
    EXPECT_EQ(result.specifier(), "https://esm.sh/react");
    EXPECT_EQ(resolve("node:fs").kind(), ResolveResult::Kind::External);
}

TEST_F(ResolveTest, Unresolvable) {
    EXPECT_EQ(resolve("./missing").kind(), ResolveResult::Kind::Unresolvable);
    EXPECT_EQ(resolve("not-installed").kind(), ResolveResult::Kind::Unresolvable);
    EXPECT_EQ(resolve("").kind(), ResolveResult::Kind::Unresolvable);
    EXPECT_EQ(esm_resolve(context_, "/app/src/index.js", Request::dynamic("x"))->kind(),
              ResolveResult::Kind::Unresolvable);
}

TEST_F(ResolveTest, RemoteOriginResolvesAgainstUrl) {
    auto result = resolve("./dep.js", "https://cdn.example/lib/mod.js");
    EXPECT_EQ(result.kind(), ResolveResult::Kind::External);
    EXPECT_EQ(result.specifier(), "https://cdn.example/lib/dep.js");
    EXPECT_EQ(resolve("bare", "https://cdn.example/lib/mod.js").kind(),
              ResolveResult::Kind::Unresolvable);
}

TEST_F(ResolveTest, ModulesAreInterned) {
    auto a = resolve("./util").modules().front();
    auto b = resolve("../src/util.js").modules().front();
    EXPECT_EQ(a, b);
    EXPECT_EQ(a, context_.module("/app/src/./util.js"));
}

TEST_F(ResolveTest, ResolutionIsMemoized) {
    auto first = esm_resolve(context_, "/app/src/index.js", Request::parse("pkg"));
    const auto executions = graph_.executions();

    // Same directory, different importing file: same key
    auto second = esm_resolve(context_, "/app/src/util.js", Request::parse("pkg"));
    EXPECT_EQ(first, second);
    EXPECT_EQ(graph_.executions(), executions);
    EXPECT_EQ(graph_.keys_for("esm_resolve").size(), 1u);
}

TEST_F(ResolveTest, ConcurrentResolutionExecutesOnce) {
    const Request request = Request::parse("@scope/modular");
    std::vector<TaskGraph::Ref<ResolveResult>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            results[i] = esm_resolve(context_, "/app/src/index.js", request);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& result : results) {
        // One computation produces one shared value
        EXPECT_EQ(result, results[0]);
    }
    EXPECT_EQ(results[0]->kind(), ResolveResult::Kind::Single);
    EXPECT_EQ(graph_.keys_for("esm_resolve").size(), 1u);
}

TEST_F(ResolveTest, ConcurrentUnresolvableIsShared) {
    std::vector<TaskGraph::Ref<ResolveResult>> results(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            results[i] = esm_resolve(context_, "/app/src/index.js", Request::parse("foo"));
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& result : results) {
        EXPECT_EQ(result, results[0]);
        EXPECT_EQ(result->kind(), ResolveResult::Kind::Unresolvable);
    }
}

TEST_F(ResolveTest, FileChangesInvalidateResolution) {
    EXPECT_EQ(resolve("./later").kind(), ResolveResult::Kind::Unresolvable);

    fs_.write("/app/src/later.js", "");
    EXPECT_FALSE(invalidate_changed_files(graph_, fs_).empty());
    EXPECT_EQ(resolved_path("./later"), "/app/src/later.js");
}

TEST_F(ResolveTest, InvalidPackageJsonIsABuildError) {
    fs_.write("/app/node_modules/broken/package.json", "{ not json");
    EXPECT_THROW(resolve("broken"), BuildError);
}

TEST(ResolveResultTest, AlternativesWithoutCandidatesAreUnresolvable) {
    EXPECT_EQ(ResolveResult::alternatives({}).kind(), ResolveResult::Kind::Unresolvable);
}
