#include "file_system.hpp"
#include "build_error.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <openssl/sha.h>

namespace quickpack {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kReadOperation = "fs.read";
constexpr std::string_view kKindOperation = "fs.kind";

std::string key_argument(const FileSystem& fs, const fs::path& path) {
    return fs.name() + "|" + path.generic_string();
}

// Returns the path of a key argument if it belongs to fs
std::optional<fs::path> key_path(const FileSystem& fs, const std::string& argument) {
    const std::string prefix = fs.name() + "|";
    if (argument.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    return fs::path(argument.substr(prefix.size()));
}

}  // namespace

std::string content_digest(std::string_view bytes) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), hash);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; i++) {
        oss << std::setw(2) << static_cast<int>(hash[i]);
    }
    return oss.str();
}

fs::path normalize_path(const fs::path& path) {
    fs::path normalized = path.lexically_normal();
    std::string generic = normalized.generic_string();
    // lexically_normal keeps a trailing separator for "a/b/.."
    if (generic.size() > 1 && generic.back() == '/') {
        generic.pop_back();
    }
    return fs::path(generic);
}

// ============================================================================
// DiskFileSystem
// ============================================================================

FileKind DiskFileSystem::kind(const fs::path& path) const {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return FileKind::Missing;
    }
    return fs::is_directory(status) ? FileKind::Directory : FileKind::File;
}

std::optional<FileContent> DiskFileSystem::read(const fs::path& path) const {
    if (kind(path) != FileKind::File) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw BuildError(path.generic_string(), "failed to open file");
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw BuildError(path.generic_string(), "failed to read file");
    }

    FileContent content;
    content.bytes = oss.str();
    content.digest = content_digest(content.bytes);
    content.revision = revision(path).value_or(0);
    return content;
}

std::optional<uint64_t> DiskFileSystem::revision(const fs::path& path) const {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(time.time_since_epoch().count());
}

// ============================================================================
// MemoryFileSystem
// ============================================================================

void MemoryFileSystem::write(const fs::path& path, std::string bytes) {
    std::unique_lock lock(mutex_);
    auto& file = files_[normalize_path(path).generic_string()];
    file.bytes = std::move(bytes);
    file.revision = ++next_revision_;
}

bool MemoryFileSystem::remove(const fs::path& path) {
    std::unique_lock lock(mutex_);
    return files_.erase(normalize_path(path).generic_string()) > 0;
}

FileKind MemoryFileSystem::kind(const fs::path& path) const {
    const std::string key = normalize_path(path).generic_string();

    std::shared_lock lock(mutex_);
    if (files_.count(key)) {
        return FileKind::File;
    }

    // Any file below key makes it a directory
    const std::string prefix = key == "/" ? key : key + "/";
    auto it = files_.lower_bound(prefix);
    if (it != files_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        return FileKind::Directory;
    }
    return FileKind::Missing;
}

std::optional<FileContent> MemoryFileSystem::read(const fs::path& path) const {
    std::shared_lock lock(mutex_);
    auto it = files_.find(normalize_path(path).generic_string());
    if (it == files_.end()) {
        return std::nullopt;
    }
    ++read_count_;

    FileContent content;
    content.bytes = it->second.bytes;
    content.digest = content_digest(content.bytes);
    content.revision = it->second.revision;
    return content;
}

std::optional<uint64_t> MemoryFileSystem::revision(const fs::path& path) const {
    std::shared_lock lock(mutex_);
    auto it = files_.find(normalize_path(path).generic_string());
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second.revision;
}

// ============================================================================
// Memoized reads
// ============================================================================

TaskGraph::Ref<std::optional<FileContent>> read_file(TaskGraph& graph, const FileSystem& fs,
                                                     const fs::path& path) {
    TaskKey key{std::string(kReadOperation), key_argument(fs, normalize_path(path))};
    return graph.run<std::optional<FileContent>>(key, [&] { return fs.read(normalize_path(path)); });
}

FileKind file_kind(TaskGraph& graph, const FileSystem& fs, const fs::path& path) {
    TaskKey key{std::string(kKindOperation), key_argument(fs, normalize_path(path))};
    return *graph.run<FileKind>(key, [&] { return fs.kind(normalize_path(path)); });
}

std::vector<fs::path> invalidate_changed_files(TaskGraph& graph, const FileSystem& fs) {
    std::vector<fs::path> changed;

    for (const auto& key : graph.keys_for(kReadOperation)) {
        auto path = key_path(fs, key.argument);
        if (!path) {
            continue;
        }
        auto cached = graph.peek<std::optional<FileContent>>(key);
        if (!cached) {
            continue;  // Still in flight or failed; the next read recomputes anyway
        }

        auto revision = fs.revision(*path);
        bool was_present = cached->has_value();
        if (!revision) {
            if (was_present) {
                graph.invalidate(key);
                changed.push_back(*path);
            }
            continue;
        }
        if (was_present && (*cached)->revision == *revision) {
            continue;
        }

        // Touched or created: compare contents so unchanged files keep their results
        std::optional<FileContent> current;
        try {
            current = fs.read(*path);
        } catch (const BuildError& e) {
            std::cerr << "Warning: " << e.what() << "\n";
            graph.invalidate(key);
            changed.push_back(*path);
            continue;
        }
        if (was_present && current && (*cached)->digest == current->digest) {
            continue;
        }
        graph.invalidate(key);
        changed.push_back(*path);
    }

    for (const auto& key : graph.keys_for(kKindOperation)) {
        auto path = key_path(fs, key.argument);
        if (!path) {
            continue;
        }
        auto cached = graph.peek<FileKind>(key);
        if (cached && *cached != fs.kind(*path)) {
            graph.invalidate(key);
            changed.push_back(*path);
        }
    }

    return changed;
}

}  // namespace quickpack
