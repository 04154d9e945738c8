#pragma once

#include "config.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include "quickjs.h"
}

namespace quickpack {

struct ExecutionStats {
    size_t memory_used = 0;
    double cpu_time_ms = 0.0;
};

struct RunResult {
    std::vector<std::string> output;  // console.log/info lines
    std::vector<std::string> errors;  // console.warn/error lines
    std::string error;                // Uncaught exception or unhandled rejection
    ExecutionStats stats;

    [[nodiscard]] bool ok() const noexcept { return error.empty(); }
};

// Evaluates a bundle in a fresh QuickJS runtime and drains its job queue.
// console output is captured into the result, not printed.
class BundleRunner {
public:
    explicit BundleRunner(const Config& config);
    ~BundleRunner();

    BundleRunner(const BundleRunner&) = delete;
    BundleRunner& operator=(const BundleRunner&) = delete;
    BundleRunner(BundleRunner&&) = delete;
    BundleRunner& operator=(BundleRunner&&) = delete;

    [[nodiscard]] RunResult run(std::string_view code, const std::string& filename);

private:
    void setup_console(RunResult& result);
    [[nodiscard]] std::string exception_message(JSValue exception);
    [[nodiscard]] std::string take_exception();
    [[nodiscard]] bool drain_jobs(RunResult& result);

    const Config& config_;
    JSRuntime* rt_ = nullptr;
    JSContext* ctx_ = nullptr;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace quickpack
