#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace quickpack {

struct Config {
    std::filesystem::path entry;
    std::filesystem::path root = ".";       // Module ids are relative to this
    std::filesystem::path output = "./dist/bundle.js";
    size_t thread_count = 0;  // 0 = hardware concurrency
    bool fetch_remote = false;  // Bundle http(s) imports instead of leaving them external
    bool watch = false;
    bool run = false;
    bool verbose = false;
    uint32_t watch_interval_ms = 500;

    // Resolution
    std::vector<std::string> extensions = {".js", ".mjs", ".cjs", ".json"};
    std::vector<std::string> main_fields = {"module", "main"};
    std::vector<std::string> builtins = {
        "assert", "buffer", "child_process", "crypto", "events", "fs", "http",
        "https", "net", "os", "path", "stream", "url", "util", "zlib"};

    // Bundle runner (QuickJS)
    size_t max_memory_mb = 64;
    uint32_t max_cpu_time_ms = 5000;

    [[nodiscard]] size_t get_thread_count() const noexcept {
        if (thread_count != 0) {
            return thread_count;
        }
        const size_t hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : hw;
    }

    [[nodiscard]] size_t get_max_memory_bytes() const noexcept {
        return max_memory_mb * 1024 * 1024;
    }

    [[nodiscard]] std::filesystem::path source_map_output() const {
        std::filesystem::path map = output;
        map += ".map";
        return map;
    }
};

}  // namespace quickpack
