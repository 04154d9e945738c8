#include "bundle_runner.hpp"

#include <sstream>
#include <stdexcept>

#include <sys/resource.h>

namespace quickpack {

namespace {

struct PendingRejection {
    JSValue promise;
    std::string message;
};

// Get current thread CPU time (user + system) in milliseconds
double get_thread_cpu_time_ms() {
    struct rusage usage;
#if defined(__linux__)
    const int who = RUSAGE_THREAD;
#else
    const int who = RUSAGE_SELF;
#endif
    if (getrusage(who, &usage) == 0) {
        double user_ms = usage.ru_utime.tv_sec * 1000.0 + usage.ru_utime.tv_usec / 1000.0;
        double sys_ms = usage.ru_stime.tv_sec * 1000.0 + usage.ru_stime.tv_usec / 1000.0;
        return user_ms + sys_ms;
    }
    return 0.0;
}

int interrupt_handler(JSRuntime* /*rt*/, void* opaque) {
    const auto* deadline = static_cast<const std::chrono::steady_clock::time_point*>(opaque);
    return std::chrono::steady_clock::now() > *deadline ? 1 : 0;
}

std::string join_args(JSContext* ctx, int argc, JSValueConst* argv) {
    std::string line;
    for (int i = 0; i < argc; i++) {
        if (i > 0) line += " ";
        const char* str = JS_ToCString(ctx, argv[i]);
        if (str) {
            line += str;
            JS_FreeCString(ctx, str);
        }
    }
    return line;
}

JSValue js_console_log(JSContext* ctx, JSValueConst /*this_val*/, int argc, JSValueConst* argv) {
    auto* result = static_cast<RunResult*>(JS_GetContextOpaque(ctx));
    result->output.push_back(join_args(ctx, argc, argv));
    return JS_UNDEFINED;
}

JSValue js_console_error(JSContext* ctx, JSValueConst /*this_val*/, int argc, JSValueConst* argv) {
    auto* result = static_cast<RunResult*>(JS_GetContextOpaque(ctx));
    result->errors.push_back(join_args(ctx, argc, argv));
    return JS_UNDEFINED;
}

std::string value_to_string(JSContext* ctx, JSValueConst value) {
    if (JS_IsObject(value)) {
        JSValue message = JS_GetPropertyStr(ctx, value, "message");
        if (!JS_IsUndefined(message) && !JS_IsException(message)) {
            const char* str = JS_ToCString(ctx, message);
            std::string text = str ? str : "";
            if (str) JS_FreeCString(ctx, str);
            JS_FreeValue(ctx, message);
            return text;
        }
        JS_FreeValue(ctx, message);
    }
    const char* str = JS_ToCString(ctx, value);
    std::string text = str ? str : "Unknown error";
    if (str) JS_FreeCString(ctx, str);
    return text;
}

void rejection_tracker(JSContext* ctx, JSValueConst promise, JSValueConst reason,
                       JS_BOOL is_handled, void* opaque) {
    auto* pending = static_cast<std::vector<PendingRejection>*>(opaque);
    if (!is_handled) {
        pending->push_back(PendingRejection{JS_DupValue(ctx, promise), value_to_string(ctx, reason)});
        return;
    }
    for (auto it = pending->begin(); it != pending->end(); ++it) {
        if (JS_VALUE_GET_PTR(it->promise) == JS_VALUE_GET_PTR(promise)) {
            JS_FreeValue(ctx, it->promise);
            pending->erase(it);
            return;
        }
    }
}

}  // namespace

BundleRunner::BundleRunner(const Config& config) : config_(config) {
    rt_ = JS_NewRuntime();
    if (!rt_) {
        throw std::runtime_error("Failed to create QuickJS runtime");
    }
    JS_SetMemoryLimit(rt_, config_.get_max_memory_bytes());

    ctx_ = JS_NewContext(rt_);
    if (!ctx_) {
        JS_FreeRuntime(rt_);
        throw std::runtime_error("Failed to create QuickJS context");
    }
}

BundleRunner::~BundleRunner() {
    if (ctx_) {
        JS_FreeContext(ctx_);
    }
    if (rt_) {
        JS_FreeRuntime(rt_);
    }
}

void BundleRunner::setup_console(RunResult& result) {
    JS_SetContextOpaque(ctx_, &result);

    JSValue global = JS_GetGlobalObject(ctx_);
    JSValue console = JS_NewObject(ctx_);

    JS_SetPropertyStr(ctx_, console, "log", JS_NewCFunction(ctx_, js_console_log, "log", 1));
    JS_SetPropertyStr(ctx_, console, "info", JS_NewCFunction(ctx_, js_console_log, "info", 1));
    JS_SetPropertyStr(ctx_, console, "warn", JS_NewCFunction(ctx_, js_console_error, "warn", 1));
    JS_SetPropertyStr(ctx_, console, "error", JS_NewCFunction(ctx_, js_console_error, "error", 1));

    JS_SetPropertyStr(ctx_, global, "console", console);
    JS_FreeValue(ctx_, global);
}

std::string BundleRunner::exception_message(JSValue exception) {
    if (JS_IsNull(exception) || JS_IsUndefined(exception)) {
        return "Unknown error";
    }

    std::ostringstream oss;
    oss << value_to_string(ctx_, exception);

    if (JS_IsObject(exception)) {
        JSValue stack = JS_GetPropertyStr(ctx_, exception, "stack");
        if (!JS_IsUndefined(stack) && !JS_IsException(stack)) {
            const char* stack_str = JS_ToCString(ctx_, stack);
            if (stack_str) {
                if (*stack_str) {
                    oss << "\nStack trace:\n" << stack_str;
                }
                JS_FreeCString(ctx_, stack_str);
            }
        }
        JS_FreeValue(ctx_, stack);
    }
    return oss.str();
}

std::string BundleRunner::take_exception() {
    JSValue exception = JS_GetException(ctx_);
    std::string message = exception_message(exception);
    JS_FreeValue(ctx_, exception);
    return message;
}

bool BundleRunner::drain_jobs(RunResult& result) {
    JSContext* job_ctx = nullptr;
    while (true) {
        int ret = JS_ExecutePendingJob(rt_, &job_ctx);
        if (ret == 0) {
            return true;
        }
        if (ret < 0) {
            result.error = take_exception();
            return false;
        }
        if (std::chrono::steady_clock::now() - start_time_ >
            std::chrono::milliseconds(config_.max_cpu_time_ms)) {
            result.error = "Execution timeout";
            return false;
        }
    }
}

RunResult BundleRunner::run(std::string_view code, const std::string& filename) {
    RunResult result;
    setup_console(result);

    std::vector<PendingRejection> pending;
    JS_SetHostPromiseRejectionTracker(rt_, rejection_tracker, &pending);

    start_time_ = std::chrono::steady_clock::now();
    auto deadline = start_time_ + std::chrono::milliseconds(config_.max_cpu_time_ms);
    JS_SetInterruptHandler(rt_, interrupt_handler, &deadline);
    const double start_cpu_ms = get_thread_cpu_time_ms();

    // JS_Eval needs a NUL-terminated buffer
    std::string source(code);
    JSValue value = JS_Eval(ctx_, source.c_str(), source.size(), filename.c_str(), JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(value)) {
        result.error = take_exception();
    } else {
        JS_FreeValue(ctx_, value);
        if (drain_jobs(result) && !pending.empty()) {
            result.error = "Unhandled promise rejection: " + pending.front().message;
        }
    }

    for (auto& rejection : pending) {
        JS_FreeValue(ctx_, rejection.promise);
    }
    JS_SetHostPromiseRejectionTracker(rt_, nullptr, nullptr);
    JS_SetInterruptHandler(rt_, nullptr, nullptr);
    JS_SetContextOpaque(ctx_, nullptr);

    result.stats.cpu_time_ms = get_thread_cpu_time_ms() - start_cpu_ms;
    JSMemoryUsage mem_usage;
    JS_ComputeMemoryUsage(rt_, &mem_usage);
    result.stats.memory_used = static_cast<size_t>(mem_usage.memory_used_size);
    return result;
}

}  // namespace quickpack
