#pragma once

#include "task_graph.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace quickpack {

enum class FileKind : uint8_t { Missing, File, Directory };

struct FileContent {
    std::string bytes;
    std::string digest;     // Hex SHA-256 prefix of bytes
    uint64_t revision = 0;  // Changes whenever the file may have changed
};

// Source of file bytes. Implementations must be safe to call from several threads.
class FileSystem {
public:
    virtual ~FileSystem() = default;

    // Distinguishes file systems that share one task graph
    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual FileKind kind(const std::filesystem::path& path) const = 0;

    // nullopt when the file does not exist; throws BuildError when it exists
    // but cannot be read.
    [[nodiscard]] virtual std::optional<FileContent> read(const std::filesystem::path& path) const = 0;

    // Cheap change indicator (mtime, version counter); nullopt when missing
    [[nodiscard]] virtual std::optional<uint64_t> revision(const std::filesystem::path& path) const = 0;
};

class DiskFileSystem final : public FileSystem {
public:
    [[nodiscard]] std::string name() const override { return "disk"; }
    [[nodiscard]] FileKind kind(const std::filesystem::path& path) const override;
    [[nodiscard]] std::optional<FileContent> read(const std::filesystem::path& path) const override;
    [[nodiscard]] std::optional<uint64_t> revision(const std::filesystem::path& path) const override;
};

// In-memory tree used by tests and tools that bundle generated sources.
// Directories exist implicitly for every parent of a written file.
class MemoryFileSystem final : public FileSystem {
public:
    explicit MemoryFileSystem(std::string name = "memory") : name_(std::move(name)) {}

    void write(const std::filesystem::path& path, std::string bytes);
    bool remove(const std::filesystem::path& path);

    [[nodiscard]] std::string name() const override { return name_; }
    [[nodiscard]] FileKind kind(const std::filesystem::path& path) const override;
    [[nodiscard]] std::optional<FileContent> read(const std::filesystem::path& path) const override;
    [[nodiscard]] std::optional<uint64_t> revision(const std::filesystem::path& path) const override;

    [[nodiscard]] uint64_t read_count() const noexcept { return read_count_.load(); }

private:
    struct File {
        std::string bytes;
        uint64_t revision = 0;
    };

    std::string name_;
    std::map<std::string, File> files_;
    uint64_t next_revision_ = 0;
    mutable std::atomic<uint64_t> read_count_{0};
    mutable std::shared_mutex mutex_;
};

// Hex digest of the first 16 bytes of the SHA-256 of bytes
[[nodiscard]] std::string content_digest(std::string_view bytes);

// Lexically normalized generic path ("a/./b/../c" -> "a/c")
[[nodiscard]] std::filesystem::path normalize_path(const std::filesystem::path& path);

// Memoized reads. These are the leaves of the task graph: every computation
// that depends on file contents or existence goes through them.
[[nodiscard]] TaskGraph::Ref<std::optional<FileContent>> read_file(
    TaskGraph& graph, const FileSystem& fs, const std::filesystem::path& path);

[[nodiscard]] FileKind file_kind(TaskGraph& graph, const FileSystem& fs,
                                 const std::filesystem::path& path);

// Compares every memoized read against fs and invalidates the entries whose
// file changed (by digest) or whose kind changed. Returns the changed paths.
std::vector<std::filesystem::path> invalidate_changed_files(TaskGraph& graph, const FileSystem& fs);

}  // namespace quickpack
