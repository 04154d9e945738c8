#pragma once

#include "asset.hpp"
#include "code_builder.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace quickpack {

enum class ChunkPlacement : uint8_t { SameChunk, OtherChunk };

// Decisions of a chunking policy that code generation consumes
class ChunkingContext {
public:
    virtual ~ChunkingContext() = default;

    // Distinguishes chunking contexts in memoization keys
    [[nodiscard]] virtual std::string key() const = 0;

    // Name of the chunk being rendered
    [[nodiscard]] virtual const std::string& chunk_name() const noexcept = 0;

    [[nodiscard]] virtual std::string module_id(const Asset& asset) const = 0;

    // Id of the runtime item that loads asset asynchronously
    [[nodiscard]] virtual std::string async_loader_id(const Asset& asset) const = 0;

    // Where asset lives relative to the chunk being rendered
    [[nodiscard]] virtual ChunkPlacement placement(const Asset& asset) const = 0;
};

// Places every module in one chunk and ids modules by their path relative to root
class SingleChunkingContext final : public ChunkingContext {
public:
    explicit SingleChunkingContext(std::filesystem::path root, std::string chunk_name = "main");

    [[nodiscard]] std::string key() const override;
    [[nodiscard]] const std::string& chunk_name() const noexcept override { return chunk_name_; }
    [[nodiscard]] std::string module_id(const Asset& asset) const override;
    [[nodiscard]] std::string async_loader_id(const Asset& asset) const override;
    [[nodiscard]] ChunkPlacement placement(const Asset& asset) const override;

private:
    std::filesystem::path root_;
    std::string chunk_name_;
};

// Renders modules into one chunk: the module runtime, then every module placed
// in this chunk wrapped in a factory, then the async loaders of dynamically
// imported modules, then the bootstrap requiring entry. Module code is pushed
// with its source map; all glue is synthetic.
[[nodiscard]] Code render_chunk(const ModuleRef& entry, const std::vector<ModuleRef>& modules,
                                const ChunkingContext& chunking);

}  // namespace quickpack
